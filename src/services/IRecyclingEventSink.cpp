#include "services/IRecyclingEventSink.hpp"

#include <exception>
#include <iostream>

namespace rcy::services {

void publish_committed(IRecyclingEventSink& sink, const rcy::domain::RecyclingEventVariant& event) {
    try {
        sink.publish(event);
    } catch (const std::exception& e) {
        std::cerr << "[events] Dropped observation: " << e.what() << std::endl;
    }
}

} // namespace rcy::services
