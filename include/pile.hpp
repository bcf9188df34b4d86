// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "admission_queue.hpp"
#include "billing_engine.hpp"
#include "charge_session.hpp"
#include "sim_clock.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace pilesim {

struct PileConfig {
    std::string id;
    ChargeType charge_type{ChargeType::Fast};
    double rated_power_kw{30.0};
    std::size_t queue_capacity{2};
    bool allow_interruption{false};
    bool enforce_charge_type{false}; // reject requests of the other charge type
};

enum class PileEventType { Queued, Admitted, Progress, Completed, Interrupted, Cancelled, Rejected };

/// \brief One observed state change. \p session is a snapshot taken when the transition happened.
struct PileEvent {
    PileEventType type;
    std::string pile_id;
    SimTime at;
    ChargeSession session;
    AdmissionResult reason{AdmissionResult::Accepted};

    std::uint32_t request_id() const { return session.id(); }
};

/// \brief One simulated charging unit: a bounded admission queue, at most one charging session, and billing.
///
/// Not thread-safe. Every call for one pile has to come from that pile's driver (see PileDriver); events are
/// handed to the sink synchronously, in the order the transitions happen.
class Pile {
public:
    using EventSink = std::function<void(const PileEvent&)>;

    Pile(PileConfig cfg, const SimulatedClock& clock, const BillingEngine& billing, EventSink sink = {});

    void set_event_sink(EventSink sink);

    /// \brief Queue a request; an idle pile starts charging it right away.
    AdmissionResult submit(ChargeRequest request);

    /// \brief Cancel a waiting request, or stop the active session (billed up to now, then Completed).
    /// \returns false when the id is unknown to this pile.
    bool cancel(std::uint32_t request_id);

    /// \brief Simulated hardware fault on the active session. Only honoured when interruption is allowed.
    /// \returns true when a session ended Interrupted.
    bool interrupt();

    /// \brief Periodic driver step: bill the active session, complete it when its target is reached, then promote
    /// the next waiting request into a free slot.
    void tick();

    /// \brief Stop the active session, cancel everything waiting and refuse new requests until open().
    void close();
    void open();

    const PileConfig& config() const { return cfg_; }
    const std::string& id() const { return cfg_.id; }
    const AdmissionQueue& queue() const { return queue_; }
    bool closed() const { return closed_; }

private:
    PileConfig cfg_;
    const SimulatedClock& clock_;
    const BillingEngine& billing_;
    EventSink sink_;
    AdmissionQueue queue_;
    bool closed_{false};
    std::uint64_t next_seq_{0};

    void promote_next(SimTime now);
    /// \returns the status the session actually ended in.
    SessionStatus stop_active(SimTime now, SessionStatus outcome);
    void emit(PileEventType type, const ChargeSession& session, SimTime at,
              AdmissionResult reason = AdmissionResult::Accepted);
};

const char* to_string(PileEventType type);

} // namespace pilesim
