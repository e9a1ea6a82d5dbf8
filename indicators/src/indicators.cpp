#include "indicators.hpp"
#include <limits>

namespace indicators {

core::TimeSeries<double> extractSource(const core::TimeSeries<core::Candle>& input, SourceField field) {
    core::TimeSeries<double> values;
    values.reserve(input.size());
    for (const auto& candle : input) {
        switch (field) {
            case SourceField::Open:  values.push_back(candle.open); break;
            case SourceField::High:  values.push_back(candle.high); break;
            case SourceField::Low:   values.push_back(candle.low); break;
            case SourceField::Close: values.push_back(candle.close); break;
            case SourceField::DollarVolume:
                values.push_back(candle.close * static_cast<double>(candle.volume));
                break;
        }
    }
    return values;
}

core::TimeSeries<double> alignToInput(const core::TimeSeries<double>& results, int lookback, size_t input_size) {
    core::TimeSeries<double> aligned(input_size, std::numeric_limits<double>::quiet_NaN());
    if (lookback < 0) {
        return aligned;
    }
    for (size_t i = 0; i < results.size(); ++i) {
        size_t target = static_cast<size_t>(lookback) + i;
        if (target >= input_size) {
            break;
        }
        aligned[target] = results[i];
    }
    return aligned;
}

std::string sourceFieldToString(SourceField field) {
    switch (field) {
        case SourceField::Open:         return "Open";
        case SourceField::High:         return "High";
        case SourceField::Low:          return "Low";
        case SourceField::Close:        return "Close";
        case SourceField::DollarVolume: return "DollarVolume";
    }
    return "Unknown";
}

} // namespace indicators
