#include "domain/errors/RecyclingError.hpp"

namespace rcy::domain {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "validation failed";
        case ErrorKind::NOT_REGISTERED: return "not registered";
        case ErrorKind::NOT_ACTIVE: return "not active";
        case ErrorKind::ALREADY_REGISTERED: return "already registered";
        case ErrorKind::CAPABILITY_MISSING: return "capability missing";
        case ErrorKind::NOT_OWNER: return "not owner";
        case ErrorKind::UNIT_NOT_FOUND: return "unit not found";
        case ErrorKind::OPERATION_FAILED: return "operation failed";
        case ErrorKind::POSTCONDITION: return "postcondition violated";
        case ErrorKind::PAUSED: return "paused";
        case ErrorKind::AUTHORIZATION: return "not authorized";
        case ErrorKind::REENTRANCY: return "reentrant call";
    }
    return "unknown error";
}

RecyclingError::RecyclingError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(to_string(kind) + ": " + detail)
    , kind_(kind)
    , detail_(detail) {}

} // namespace rcy::domain
