#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace rcy::domain {

// Identifies one unit within its asset class. Every value, zero included,
// is a valid id.
class UnitId {
public:
    explicit UnitId(uint64_t value) : value_(value) {}

    static UnitId from_string(const std::string& str);

    uint64_t value() const noexcept { return value_; }
    std::string to_string() const { return std::to_string(value_); }

    bool operator==(const UnitId&) const = default;
    auto operator<=>(const UnitId&) const = default;

private:
    uint64_t value_;
};

} // namespace rcy::domain
