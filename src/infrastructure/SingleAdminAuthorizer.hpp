#pragma once

#include "services/IAuthorizer.hpp"

namespace rcy::infrastructure {

// One identity may perform every administrative operation.
class SingleAdminAuthorizer : public rcy::services::IAuthorizer {
public:
    explicit SingleAdminAuthorizer(rcy::domain::ActorId admin) : admin_(std::move(admin)) {}

    bool authorize(const rcy::domain::ActorId& actor,
                   rcy::services::AdminOperation) const override {
        return actor == admin_;
    }

    const rcy::domain::ActorId& admin() const noexcept { return admin_; }

private:
    rcy::domain::ActorId admin_;
};

} // namespace rcy::infrastructure
