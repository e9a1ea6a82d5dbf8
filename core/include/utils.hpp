#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Format a daily Timestamp as YYYY-MM-DD (UTC)
    std::string dateToString(const Timestamp& ts);

    // Parse YYYY-MM-DD into the UTC midnight Timestamp of that day
    Timestamp stringToDate(const std::string& ymd);

    // UTC midnight of the current day
    Timestamp todayUtc();

    Timestamp addDays(const Timestamp& ts, int days);

    // Whole calendar days from 'from' to 'to' (negative if 'to' is earlier)
    long long daysBetween(const Timestamp& from, const Timestamp& to);

    std::string trim(const std::string& s);
    std::string toUpper(const std::string& s);
    std::string toLower(const std::string& s);

} // namespace utils
} // namespace core
