#pragma once

#include "services/IAssetClassResolver.hpp"

#include <map>
#include <memory>

namespace rcy::infrastructure {

// In-process address book of asset-class collaborators.
class AssetClassDirectory : public rcy::services::IAssetClassResolver {
public:
    void bind(const rcy::domain::AssetClassId& class_id,
              std::shared_ptr<rcy::services::IAssetClass> collaborator);
    void unbind(const rcy::domain::AssetClassId& class_id);

    std::shared_ptr<rcy::services::IAssetClass> resolve(
        const rcy::domain::AssetClassId& class_id) const override;

    size_t size() const noexcept { return collaborators_.size(); }

private:
    std::map<rcy::domain::AssetClassId, std::shared_ptr<rcy::services::IAssetClass>> collaborators_;
};

} // namespace rcy::infrastructure
