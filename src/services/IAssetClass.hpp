#pragma once

#include "domain/value_objects/ActorId.hpp"
#include "domain/value_objects/UnitId.hpp"

#include <stdexcept>
#include <string>

namespace rcy::services {

enum class Capability { OWNERSHIP_QUERY, TRANSFER, DESTRUCTION };

std::string to_string(Capability capability);

// Contract an externally supplied asset class must honour. Implementations
// are untrusted: any call may throw, and any call may re-enter the engine.
class IAssetClass {
public:
    // Throws if the unit does not exist.
    virtual rcy::domain::ActorId owner_of(const rcy::domain::UnitId& unit_id) const = 0;

    // Throws if the transfer is refused.
    virtual void transfer(const rcy::domain::ActorId& from, const rcy::domain::ActorId& to,
                          const rcy::domain::UnitId& unit_id) = 0;

    // Optional. Support is only discovered by calling it.
    virtual void destroy(const rcy::domain::UnitId& unit_id) {
        throw std::logic_error("destruction is not supported (unit " + unit_id.to_string() + ")");
    }

    // Capability introspection used when a class is registered.
    virtual bool supports(Capability capability) const = 0;

    virtual ~IAssetClass() = default;
};

} // namespace rcy::services
