#pragma once

#include <stdexcept>
#include <string>

namespace rcy::domain {

enum class DisposalMethod { DESTRUCTION, CUSTODIAL_TRANSFER };

inline std::string to_string(DisposalMethod method) {
    return method == DisposalMethod::DESTRUCTION ? "destruction" : "custodial_transfer";
}

inline DisposalMethod disposal_method_from_string(const std::string& str) {
    if (str == "destruction") return DisposalMethod::DESTRUCTION;
    if (str == "custodial_transfer") return DisposalMethod::CUSTODIAL_TRANSFER;
    throw std::invalid_argument("Invalid disposal method: " + str);
}

} // namespace rcy::domain
