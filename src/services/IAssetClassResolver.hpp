#pragma once

#include "domain/value_objects/AssetClassId.hpp"
#include "services/IAssetClass.hpp"

#include <memory>

namespace rcy::services {

class IAssetClassResolver {
public:
    // nullptr when nothing answers at this id.
    virtual std::shared_ptr<IAssetClass> resolve(const rcy::domain::AssetClassId& class_id) const = 0;
    virtual ~IAssetClassResolver() = default;
};

} // namespace rcy::services
