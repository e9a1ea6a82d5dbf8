#include "stooq_client.hpp"
#include "csv_loader.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <cpr/cpr.h>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace data {

StooqClient::StooqClient(std::string base_url, int timeout_ms)
    : base_url_(std::move(base_url)), timeout_ms_(timeout_ms)
{
    core::logging::getLogger()->debug("StooqClient created for {}.", base_url_);
}

std::string StooqClient::symbolFor(const std::string& ticker) {
    return core::utils::toLower(core::utils::trim(ticker)) + ".us";
}

std::string StooqClient::urlFor(const std::string& ticker) const {
    return fmt::format("{}?s={}&i=d", base_url_, symbolFor(ticker));
}

core::TimeSeries<core::Candle> StooqClient::fetchDaily(const std::string& ticker) const {
    auto logger = core::logging::getLogger();
    const std::string url = urlFor(ticker);
    logger->debug("Requesting Stooq URL: {}", url);

    cpr::Response response = cpr::Get(cpr::Url{base_url_},
                                      cpr::Parameters{{"s", symbolFor(ticker)}, {"i", "d"}},
                                      cpr::Header{{"User-Agent", user_agent_}},
                                      cpr::Timeout{timeout_ms_});

    logger->debug("Stooq response for {}: Status {}, Body size {}", ticker, response.status_code, response.text.length());

    if (response.error) {
        throw core::ApiRequestException(fmt::format(
            "Stooq request for {} failed (CPR error): Code={}, Message='{}'",
            ticker, static_cast<int>(response.error.code), response.error.message));
    }

    if (response.status_code != 200) {
        throw core::ApiRequestException(fmt::format("Stooq HTTP {} for {}: {}", response.status_code, ticker, url));
    }

    const std::string text = core::utils::trim(response.text);
    if (text.rfind("404", 0) == 0 || text.find("No data") != std::string::npos || text.size() < 50) {
        throw core::ApiRequestException(fmt::format("No Stooq data for {}", ticker));
    }

    try {
        auto candles = csv::parseStooqCsvText(text, url);
        logger->info("Received {} bars for {} from Stooq.", candles.size(), ticker);
        return candles;
    } catch (const core::DataLoadException& e) {
        throw core::ApiRequestException(fmt::format("Unexpected Stooq payload for {}: {}", ticker, e.what()));
    }
}

} // namespace data
