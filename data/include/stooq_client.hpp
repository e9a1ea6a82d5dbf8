#pragma once

#include <string>
#include "datatypes.hpp" // For TimeSeries, Candle

namespace data {

class StooqClient {
public:
    explicit StooqClient(std::string base_url = "https://stooq.com/q/d/l/",
                         int timeout_ms = 30000);

    // Full daily history for a US ticker. Throws ApiRequestException on HTTP or payload errors.
    core::TimeSeries<core::Candle> fetchDaily(const std::string& ticker) const;

    // "AAPL" -> "aapl.us"
    static std::string symbolFor(const std::string& ticker);

    std::string urlFor(const std::string& ticker) const;

private:
    std::string base_url_;
    int timeout_ms_;
    std::string user_agent_ = "poos-backtest/0.1";
};

} // namespace data
