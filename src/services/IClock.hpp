#pragma once

#include "domain/value_objects/Timestamp.hpp"

namespace rcy::services {

class IClock {
public:
    virtual rcy::domain::Timestamp now() const = 0;
    virtual ~IClock() = default;
};

} // namespace rcy::services
