#include "services/ExchangeGate.hpp"

#include "domain/errors/RecyclingError.hpp"

using namespace rcy::domain;

namespace rcy::services {

ExchangeGate::Scope::~Scope() {
    gate_.exchange_in_progress_ = false;
}

ExchangeGate::ExternalCall::~ExternalCall() {
    gate_.external_call_in_progress_ = false;
}

ExchangeGate::Scope ExchangeGate::enter(const std::string& operation) {
    if (exchange_in_progress_) {
        throw ReentrancyError(operation + " called while another exchange is in progress");
    }
    exchange_in_progress_ = true;
    return Scope(*this);
}

ExchangeGate::ExternalCall ExchangeGate::begin_external_call(const std::string& operation) {
    if (external_call_in_progress_) {
        throw ReentrancyError(operation + " called from inside a collaborator call");
    }
    external_call_in_progress_ = true;
    return ExternalCall(*this);
}

void ExchangeGate::require_no_external_call(const std::string& operation) const {
    if (external_call_in_progress_) {
        throw ReentrancyError(operation + " called from inside a collaborator call");
    }
}

void ExchangeGate::require_not_paused() const {
    if (paused_) {
        throw PausedError("exchanges are paused");
    }
}

bool ExchangeGate::pause() {
    if (paused_) return false;
    paused_ = true;
    return true;
}

bool ExchangeGate::unpause() {
    if (!paused_) return false;
    paused_ = false;
    return true;
}

} // namespace rcy::services
