#include "infrastructure/AssetClassDirectory.hpp"

#include <stdexcept>

namespace rcy::infrastructure {

void AssetClassDirectory::bind(const rcy::domain::AssetClassId& class_id,
                               std::shared_ptr<rcy::services::IAssetClass> collaborator) {
    if (!collaborator) {
        throw std::invalid_argument("cannot bind " + class_id.value() + " to a null collaborator");
    }
    collaborators_.insert_or_assign(class_id, std::move(collaborator));
}

void AssetClassDirectory::unbind(const rcy::domain::AssetClassId& class_id) {
    collaborators_.erase(class_id);
}

std::shared_ptr<rcy::services::IAssetClass> AssetClassDirectory::resolve(
    const rcy::domain::AssetClassId& class_id) const {
    auto it = collaborators_.find(class_id);
    if (it == collaborators_.end()) return nullptr;
    return it->second;
}

} // namespace rcy::infrastructure
