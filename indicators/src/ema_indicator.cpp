#include "ema_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

EmaIndicator::EmaIndicator(int period, SourceField source)
    : period_(period), source_(source), lookback_(0) {
    if (period_ < 2) {
        throw std::invalid_argument("EMA period must be at least 2.");
    }

    lookback_ = TA_EMA_Lookback(period_);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_EMA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = source_ == SourceField::Close
        ? fmt::format("EMA({})", period_)
        : fmt::format("EMA({},{})", period_, sourceFieldToString(source_));
}

std::string EmaIndicator::getName() const {
    return name_;
}

int EmaIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& EmaIndicator::getResult() const {
    return results_;
}

void EmaIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    calculateValues(extractSource(input, source_));
}

void EmaIndicator::calculateValues(const core::TimeSeries<double>& values) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (values.size() <= static_cast<size_t>(lookback_)) {
        logger->trace("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      values.size(), lookback_, name_);
        return;
    }

    results_.resize(values.size() - static_cast<size_t>(lookback_));

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_EMA(
        0,
        static_cast<int>(values.size()) - 1,
        values.data(),
        period_,
        &out_begin_idx,
        &out_nb_element,
        results_.data()
    );

    if (ret_code != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA-Lib TA_EMA calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_) {
        logger->warn("TA_EMA out_begin_idx ({}) does not match calculated lookback ({}) for {}. Results might be misaligned.",
                     out_begin_idx, lookback_, name_);
    }
    results_.resize(static_cast<size_t>(out_nb_element));
    logger->trace("Calculated {} results for {}", results_.size(), name_);
}

} // namespace indicators
