#pragma once

#include <compare>
#include <string>

namespace rcy::domain {

class AssetClassId {
public:
    explicit AssetClassId(std::string id);

    const std::string& value() const noexcept { return id_; }

    bool operator==(const AssetClassId&) const = default;
    auto operator<=>(const AssetClassId&) const = default;

private:
    std::string id_;
};

} // namespace rcy::domain
