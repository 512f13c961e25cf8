#pragma once

#include "domain/value_objects/ActorId.hpp"

#include <string>

namespace rcy::services {

enum class AdminOperation {
    REGISTER_CLASS,
    UPDATE_RATE,
    SET_ACTIVE,
    DEACTIVATE,
    PAUSE,
    UNPAUSE,
    EMERGENCY_RESCUE
};

std::string to_string(AdminOperation operation);

class IAuthorizer {
public:
    virtual bool authorize(const rcy::domain::ActorId& actor, AdminOperation operation) const = 0;
    virtual ~IAuthorizer() = default;
};

// Throws AuthorizationError unless the authorizer admits the actor.
void require_authorized(const IAuthorizer& authorizer, const rcy::domain::ActorId& actor,
                        AdminOperation operation);

} // namespace rcy::services
