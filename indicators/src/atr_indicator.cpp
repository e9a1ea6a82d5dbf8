#include "atr_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

AtrIndicator::AtrIndicator(int period) : period_(period), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("ATR period must be positive.");
    }

    lookback_ = TA_ATR_Lookback(period_);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_ATR_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("ATR({})", period_);
}

std::string AtrIndicator::getName() const {
    return name_;
}

int AtrIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& AtrIndicator::getResult() const {
    return results_;
}

void AtrIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->trace("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> highs = extractSource(input, SourceField::High);
    std::vector<double> lows = extractSource(input, SourceField::Low);
    std::vector<double> closes = extractSource(input, SourceField::Close);

    results_.resize(input.size() - static_cast<size_t>(lookback_));

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_ATR(
        0,
        static_cast<int>(input.size()) - 1,
        highs.data(),
        lows.data(),
        closes.data(),
        period_,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA-Lib TA_ATR calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_) {
        logger->warn("TA_ATR out_begin_idx ({}) does not match calculated lookback ({}) for {}. Results might be misaligned.",
                     out_begin_idx, lookback_, name_);
    }
    results_.resize(static_cast<size_t>(out_nb_element));
}

} // namespace indicators
