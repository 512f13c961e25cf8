#include "infrastructure/SimpleAssetClass.hpp"

#include <stdexcept>

using namespace rcy::domain;

namespace rcy::infrastructure {

SimpleAssetClass::SimpleAssetClass(bool supports_destruction)
    : supports_destruction_(supports_destruction) {}

void SimpleAssetClass::mint(const UnitId& unit_id, const ActorId& owner) {
    if (!owners_.emplace(unit_id, owner).second) {
        throw std::invalid_argument("unit " + unit_id.to_string() + " already exists");
    }
}

ActorId SimpleAssetClass::owner_of(const UnitId& unit_id) const {
    auto it = owners_.find(unit_id);
    if (it == owners_.end()) {
        throw std::out_of_range("unit " + unit_id.to_string() + " does not exist");
    }
    return it->second;
}

void SimpleAssetClass::transfer(const ActorId& from, const ActorId& to, const UnitId& unit_id) {
    auto it = owners_.find(unit_id);
    if (it == owners_.end()) {
        throw std::out_of_range("unit " + unit_id.to_string() + " does not exist");
    }
    if (it->second != from) {
        throw std::runtime_error("unit " + unit_id.to_string() + " is not owned by " + from.value());
    }
    it->second = to;
}

void SimpleAssetClass::destroy(const UnitId& unit_id) {
    if (!supports_destruction_) {
        IAssetClass::destroy(unit_id);
    }
    if (owners_.erase(unit_id) == 0) {
        throw std::out_of_range("unit " + unit_id.to_string() + " does not exist");
    }
}

bool SimpleAssetClass::supports(rcy::services::Capability capability) const {
    if (capability == rcy::services::Capability::DESTRUCTION) {
        return supports_destruction_;
    }
    return true;
}

bool SimpleAssetClass::exists(const UnitId& unit_id) const {
    return owners_.count(unit_id) > 0;
}

} // namespace rcy::infrastructure
