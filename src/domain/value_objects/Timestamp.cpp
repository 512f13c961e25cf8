#include "domain/value_objects/Timestamp.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace rcy::domain {

namespace {

std::tm to_utc(int64_t ms) {
    std::time_t time = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    gmtime_r(&time, &tm);
    return tm;
}

} // namespace

Timestamp::Timestamp(int64_t milliseconds_since_epoch) : ms_(milliseconds_since_epoch) {
    if (milliseconds_since_epoch < 0) {
        throw std::out_of_range(
            "Timestamp must be non-negative, got: " + std::to_string(milliseconds_since_epoch));
    }
}

Timestamp Timestamp::from_string(const std::string& str) {
    return Timestamp(std::stoll(str));
}

std::string Timestamp::iso8601() const {
    auto tm = to_utc(ms_);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << (ms_ % 1000) << 'Z';
    return oss.str();
}

std::string Timestamp::date_string() const {
    auto tm = to_utc(ms_);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
}

std::string Timestamp::hour_string() const {
    auto tm = to_utc(ms_);
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << tm.tm_hour;
    return oss.str();
}

} // namespace rcy::domain
