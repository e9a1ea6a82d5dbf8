#pragma once

#include "datatypes.hpp" // Needs Candle, TimeSeries
#include <string>
#include <vector>

namespace indicators {

// Which series of a candle an indicator is computed from
enum class SourceField {
    Open,
    High,
    Low,
    Close,
    DollarVolume // close * volume
};

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "EMA(20)", "ATR(14)")
    virtual std::string getName() const = 0;

    // Number of leading input points consumed before the first valid output.
    virtual int getLookback() const = 0;

    // Calculate the indicator based on input candle data and store the result internally.
    virtual void calculate(const core::TimeSeries<core::Candle>& input) = 0;

    // Raw TA-Lib output. Its first element corresponds to input index getLookback(),
    // so it is shorter than the input. Use alignToInput() for index-aligned values.
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

// Pull one field out of a candle series
core::TimeSeries<double> extractSource(const core::TimeSeries<core::Candle>& input, SourceField field);

// Expand a lookback-offset result to input length, NaN for the warm-up points
core::TimeSeries<double> alignToInput(const core::TimeSeries<double>& results, int lookback, size_t input_size);

std::string sourceFieldToString(SourceField field);

} // namespace indicators
