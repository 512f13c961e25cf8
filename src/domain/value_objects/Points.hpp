#pragma once

#include <compare>
#include <cstdint>

namespace rcy::domain {

// Point amounts and per-unit rates. Arithmetic is checked: anything that
// would wrap throws std::overflow_error instead.
class Points {
public:
    explicit Points(uint64_t amount) : amount_(amount) {}

    static Points zero() { return Points(0); }

    uint64_t amount() const noexcept { return amount_; }
    bool is_zero() const noexcept { return amount_ == 0; }

    Points operator+(const Points& other) const;
    Points& operator+=(const Points& other);
    Points times(uint64_t quantity) const;

    bool operator==(const Points&) const = default;
    auto operator<=>(const Points&) const = default;

private:
    uint64_t amount_;
};

} // namespace rcy::domain
