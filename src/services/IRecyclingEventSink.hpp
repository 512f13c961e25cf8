#pragma once

#include "domain/events/RecyclingEventVariant.hpp"

namespace rcy::services {

// Receives one observation per registry change, completed exchange,
// failed batch item, rescue and pause toggle.
class IRecyclingEventSink {
public:
    virtual void publish(const rcy::domain::RecyclingEventVariant& event) = 0;
    virtual ~IRecyclingEventSink() = default;
};

// Publishes an observation of a change that is already committed. A sink
// failure is logged and dropped; it never undoes or fails the change.
void publish_committed(IRecyclingEventSink& sink, const rcy::domain::RecyclingEventVariant& event);

} // namespace rcy::services
