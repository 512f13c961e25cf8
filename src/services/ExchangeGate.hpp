#pragma once

#include <string>

namespace rcy::services {

// Pause flag and reentrancy guards shared by every service.
//
// A Scope marks a top-level exchange (single, batch or rescue) in progress;
// only one may exist at a time. An ExternalCall marks a collaborator call in
// flight; registry and admin mutations are refused while one exists, so a
// collaborator cannot change the state the next batch item will read.
class ExchangeGate {
public:
    class Scope {
    public:
        ~Scope();
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        friend class ExchangeGate;
        explicit Scope(ExchangeGate& gate) : gate_(gate) {}
        ExchangeGate& gate_;
    };

    class ExternalCall {
    public:
        ~ExternalCall();
        ExternalCall(const ExternalCall&) = delete;
        ExternalCall& operator=(const ExternalCall&) = delete;

    private:
        friend class ExchangeGate;
        explicit ExternalCall(ExchangeGate& gate) : gate_(gate) {}
        ExchangeGate& gate_;
    };

    // Throws ReentrancyError if a scope is already held.
    [[nodiscard]] Scope enter(const std::string& operation);

    // Throws ReentrancyError if another collaborator call is in flight.
    [[nodiscard]] ExternalCall begin_external_call(const std::string& operation);

    void require_no_external_call(const std::string& operation) const;
    void require_not_paused() const;

    // Return true when the flag actually changed.
    bool pause();
    bool unpause();

    bool paused() const noexcept { return paused_; }
    bool exchange_in_progress() const noexcept { return exchange_in_progress_; }
    bool external_call_in_progress() const noexcept { return external_call_in_progress_; }

private:
    bool paused_{false};
    bool exchange_in_progress_{false};
    bool external_call_in_progress_{false};
};

} // namespace rcy::services
