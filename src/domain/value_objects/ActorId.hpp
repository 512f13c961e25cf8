#pragma once

#include <compare>
#include <string>

namespace rcy::domain {

// Opaque identity of whoever acts on the engine: end users, the
// administrator, the custodial holding and recovery destinations.
class ActorId {
public:
    explicit ActorId(std::string id);

    const std::string& value() const noexcept { return id_; }

    bool operator==(const ActorId&) const = default;
    auto operator<=>(const ActorId&) const = default;

private:
    std::string id_;
};

} // namespace rcy::domain
