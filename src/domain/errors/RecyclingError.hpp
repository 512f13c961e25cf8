#pragma once

#include <stdexcept>
#include <string>

namespace rcy::domain {

enum class ErrorKind {
    VALIDATION,
    NOT_REGISTERED,
    NOT_ACTIVE,
    ALREADY_REGISTERED,
    CAPABILITY_MISSING,
    NOT_OWNER,
    UNIT_NOT_FOUND,
    OPERATION_FAILED,
    POSTCONDITION,
    PAUSED,
    AUTHORIZATION,
    REENTRANCY
};

std::string to_string(ErrorKind kind);

// Base of every failure the engine reports. what() is "<kind>: <detail>".
class RecyclingError : public std::runtime_error {
public:
    RecyclingError(ErrorKind kind, const std::string& detail);

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

template <ErrorKind Kind>
class KindedError : public RecyclingError {
public:
    explicit KindedError(const std::string& detail) : RecyclingError(Kind, detail) {}
};

using ValidationError = KindedError<ErrorKind::VALIDATION>;
using NotRegisteredError = KindedError<ErrorKind::NOT_REGISTERED>;
using NotActiveError = KindedError<ErrorKind::NOT_ACTIVE>;
using AlreadyRegisteredError = KindedError<ErrorKind::ALREADY_REGISTERED>;
using CapabilityMissingError = KindedError<ErrorKind::CAPABILITY_MISSING>;
using NotOwnerError = KindedError<ErrorKind::NOT_OWNER>;
using UnitNotFoundError = KindedError<ErrorKind::UNIT_NOT_FOUND>;
using OperationFailedError = KindedError<ErrorKind::OPERATION_FAILED>;
using PostconditionError = KindedError<ErrorKind::POSTCONDITION>;
using PausedError = KindedError<ErrorKind::PAUSED>;
using AuthorizationError = KindedError<ErrorKind::AUTHORIZATION>;
using ReentrancyError = KindedError<ErrorKind::REENTRANCY>;

} // namespace rcy::domain
