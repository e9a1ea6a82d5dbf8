#include "utils.hpp"
#include <iomanip> // For std::put_time, std::get_time
#include <sstream>
#include <string>
#include <stdexcept>
#include <chrono>
#include <ctime>
#include <algorithm>
#include <cctype>

namespace core {
namespace utils {

    namespace {
        constexpr long long kSecondsPerDay = 24LL * 60 * 60;
    }

    Timestamp stringToDate(const std::string& ymd) {
        std::tm tm = {};
        std::istringstream ss(trim(ymd));

        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse date (expected YYYY-MM-DD): " + ymd);
        }
        // Anything left over (other than whitespace) means the string was not a plain date
        std::string rest;
        if (ss >> rest) {
            throw std::runtime_error("Unexpected trailing characters in date: " + ymd);
        }

        // timegm interprets struct tm as UTC. Use _mkgmtime on Windows.
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == (time_t)-1) {
            throw std::runtime_error("Failed to convert parsed date to UTC epoch seconds: " + ymd);
        }
        return std::chrono::system_clock::from_time_t(tt);
    }

    std::string dateToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);

        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d");
        return oss.str();
    }

    Timestamp todayUtc() {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        secs -= secs % kSecondsPerDay;
        return Timestamp(std::chrono::seconds(secs));
    }

    Timestamp addDays(const Timestamp& ts, int days) {
        return ts + std::chrono::hours(24LL * days);
    }

    long long daysBetween(const Timestamp& from, const Timestamp& to) {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
        return secs / kSecondsPerDay;
    }

    std::string trim(const std::string& s) {
        auto not_space = [](unsigned char c) { return !std::isspace(c); };
        auto begin = std::find_if(s.begin(), s.end(), not_space);
        auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
        return (begin < end) ? std::string(begin, end) : std::string();
    }

    std::string toUpper(const std::string& s) {
        std::string out = s;
        std::transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }

    std::string toLower(const std::string& s) {
        std::string out = s;
        std::transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

} // namespace utils

    std::string exitReasonToString(ExitReason reason) {
        switch (reason) {
            case ExitReason::Stop:          return "STOP";
            case ExitReason::BreakevenStop: return "BREAKEVEN_STOP";
            case ExitReason::Target:        return "TARGET";
            case ExitReason::EndOfData:     return "END_OF_DATA";
        }
        return "UNKNOWN";
    }

} // namespace core
