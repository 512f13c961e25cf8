#pragma once

#include "services/IClock.hpp"

#include <chrono>

namespace rcy::infrastructure {

class SystemClock : public rcy::services::IClock {
public:
    rcy::domain::Timestamp now() const override {
        auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return rcy::domain::Timestamp(
            std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
    }
};

} // namespace rcy::infrastructure
