#include "domain/value_objects/Points.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace rcy::domain {

Points Points::operator+(const Points& other) const {
    if (other.amount_ > std::numeric_limits<uint64_t>::max() - amount_) {
        throw std::overflow_error(
            "Points addition overflows: " + std::to_string(amount_) + " + " +
            std::to_string(other.amount_));
    }
    return Points(amount_ + other.amount_);
}

Points& Points::operator+=(const Points& other) {
    *this = *this + other;
    return *this;
}

Points Points::times(uint64_t quantity) const {
    if (quantity != 0 && amount_ > std::numeric_limits<uint64_t>::max() / quantity) {
        throw std::overflow_error(
            "Points multiplication overflows: " + std::to_string(amount_) + " * " +
            std::to_string(quantity));
    }
    return Points(amount_ * quantity);
}

} // namespace rcy::domain
