#include "services/IAuthorizer.hpp"

#include "domain/errors/RecyclingError.hpp"

namespace rcy::services {

std::string to_string(AdminOperation operation) {
    switch (operation) {
        case AdminOperation::REGISTER_CLASS: return "register";
        case AdminOperation::UPDATE_RATE: return "update_rate";
        case AdminOperation::SET_ACTIVE: return "set_active";
        case AdminOperation::DEACTIVATE: return "deactivate";
        case AdminOperation::PAUSE: return "pause";
        case AdminOperation::UNPAUSE: return "unpause";
        case AdminOperation::EMERGENCY_RESCUE: return "emergency_rescue";
    }
    return "unknown";
}

void require_authorized(const IAuthorizer& authorizer, const rcy::domain::ActorId& actor,
                        AdminOperation operation) {
    if (!authorizer.authorize(actor, operation)) {
        throw rcy::domain::AuthorizationError(
            actor.value() + " may not perform " + to_string(operation));
    }
}

} // namespace rcy::services
