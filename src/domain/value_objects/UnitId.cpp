#include "domain/value_objects/UnitId.hpp"

#include "domain/errors/RecyclingError.hpp"

#include <stdexcept>

namespace rcy::domain {

UnitId UnitId::from_string(const std::string& str) {
    if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos) {
        throw ValidationError("unit id must be a non-negative integer, got: '" + str + "'");
    }
    try {
        return UnitId(std::stoull(str));
    } catch (const std::out_of_range&) {
        throw ValidationError("unit id out of range: " + str);
    }
}

} // namespace rcy::domain
