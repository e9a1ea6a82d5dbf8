#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Exponential moving average (TA-Lib, seeded with the SMA of the first 'period' values)
class EmaIndicator : public IIndicator {
public:
    explicit EmaIndicator(int period, SourceField source = SourceField::Close);

    virtual ~EmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    // Same calculation over an arbitrary series (e.g. a relative-strength ratio)
    void calculateValues(const core::TimeSeries<double>& values);

private:
    const int period_;
    SourceField source_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
