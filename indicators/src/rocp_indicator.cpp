#include "rocp_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

RocpIndicator::RocpIndicator(int period, SourceField source)
    : period_(period), source_(source), lookback_(0) {
    if (period_ <= 0) {
        throw std::invalid_argument("ROCP period must be positive.");
    }

    lookback_ = TA_ROCP_Lookback(period_);
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_ROCP_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("ROCP({})", period_);
}

std::string RocpIndicator::getName() const {
    return name_;
}

int RocpIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& RocpIndicator::getResult() const {
    return results_;
}

void RocpIndicator::calculate(const core::TimeSeries<core::Candle>& input) {
    auto logger = core::logging::getLogger();
    results_.clear();

    if (input.size() <= static_cast<size_t>(lookback_)) {
        logger->trace("Input size ({}) is less than or equal to lookback ({}) for {}. No results generated.",
                      input.size(), lookback_, name_);
        return;
    }

    std::vector<double> values = extractSource(input, source_);
    results_.resize(values.size() - static_cast<size_t>(lookback_));

    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_ROCP(
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
            fmt::format("TA-Lib TA_ROCP calculation failed for {} with error code: {}", name_, static_cast<int>(ret_code)));
    }

    if (out_begin_idx != lookback_) {
        logger->warn("TA_ROCP out_begin_idx ({}) does not match calculated lookback ({}) for {}. Results might be misaligned.",
                     out_begin_idx, lookback_, name_);
    }
    results_.resize(static_cast<size_t>(out_nb_element));
}

} // namespace indicators
