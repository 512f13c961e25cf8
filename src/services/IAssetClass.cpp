#include "services/IAssetClass.hpp"

namespace rcy::services {

std::string to_string(Capability capability) {
    switch (capability) {
        case Capability::OWNERSHIP_QUERY: return "ownership_query";
        case Capability::TRANSFER: return "transfer";
        case Capability::DESTRUCTION: return "destruction";
    }
    return "unknown";
}

} // namespace rcy::services
