#include "domain/value_objects/ActorId.hpp"

#include "domain/errors/RecyclingError.hpp"

namespace rcy::domain {

ActorId::ActorId(std::string id) : id_(std::move(id)) {
    if (id_.empty()) {
        throw ValidationError("actor id must not be empty");
    }
}

} // namespace rcy::domain
