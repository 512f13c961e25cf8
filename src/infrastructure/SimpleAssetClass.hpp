#pragma once

#include "services/IAssetClass.hpp"

#include <map>

namespace rcy::infrastructure {

// Reference asset class kept entirely in memory: a map from unit to owner.
// Used by the script runner and as the well-behaved collaborator in tests.
class SimpleAssetClass : public rcy::services::IAssetClass {
public:
    explicit SimpleAssetClass(bool supports_destruction = true);

    void mint(const rcy::domain::UnitId& unit_id, const rcy::domain::ActorId& owner);

    rcy::domain::ActorId owner_of(const rcy::domain::UnitId& unit_id) const override;
    void transfer(const rcy::domain::ActorId& from, const rcy::domain::ActorId& to,
                  const rcy::domain::UnitId& unit_id) override;
    void destroy(const rcy::domain::UnitId& unit_id) override;
    bool supports(rcy::services::Capability capability) const override;

    bool exists(const rcy::domain::UnitId& unit_id) const;
    size_t unit_count() const noexcept { return owners_.size(); }

private:
    bool supports_destruction_;
    std::map<rcy::domain::UnitId, rcy::domain::ActorId> owners_;
};

} // namespace rcy::infrastructure
