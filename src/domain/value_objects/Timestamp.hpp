#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace rcy::domain {

// Milliseconds since the Unix epoch.
class Timestamp {
public:
    explicit Timestamp(int64_t milliseconds_since_epoch);

    static Timestamp from_string(const std::string& str);

    int64_t milliseconds() const noexcept { return ms_; }

    // UTC calendar renderings, used for event output and storage paths.
    std::string iso8601() const;
    std::string date_string() const;
    std::string hour_string() const;

    bool operator==(const Timestamp&) const = default;
    auto operator<=>(const Timestamp&) const = default;

private:
    int64_t ms_;
};

} // namespace rcy::domain
