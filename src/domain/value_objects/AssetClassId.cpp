#include "domain/value_objects/AssetClassId.hpp"

#include "domain/errors/RecyclingError.hpp"

namespace rcy::domain {

AssetClassId::AssetClassId(std::string id) : id_(std::move(id)) {
    if (id_.empty()) {
        throw ValidationError("asset class id must not be empty");
    }
}

} // namespace rcy::domain
