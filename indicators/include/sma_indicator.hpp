#pragma once

#include "indicators.hpp" // Base interface
#include <vector>
#include <string>

namespace indicators {

// Simple moving average, used for the average dollar volume liquidity screen
class SmaIndicator : public IIndicator {
public:
    explicit SmaIndicator(int period, SourceField source = SourceField::Close);

    virtual ~SmaIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    SourceField source_;
    int lookback_;              // Calculated TA-Lib lookback
    std::string name_;          // e.g. "SMA(20,DollarVolume)"
    core::TimeSeries<double> results_;
};

} // namespace indicators
