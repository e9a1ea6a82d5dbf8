#pragma once

#include "indicators.hpp"
#include <vector>
#include <string>

namespace indicators {

// Rate of change as a fraction: (price - price[n ago]) / price[n ago].
// With period 63 this is the trailing 3-month performance.
class RocpIndicator : public IIndicator {
public:
    explicit RocpIndicator(int period, SourceField source = SourceField::Close);

    virtual ~RocpIndicator() override = default;

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::Candle>& input) override;
    const core::TimeSeries<double>& getResult() const override;

private:
    const int period_;
    SourceField source_;
    int lookback_;
    std::string name_;
    core::TimeSeries<double> results_;
};

} // namespace indicators
