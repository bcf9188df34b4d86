// SPDX-License-Identifier: Apache-2.0
#include "pile.hpp"

#include <utility>

#include <everest/logging.hpp>

namespace pilesim {

Pile::Pile(PileConfig cfg, const SimulatedClock& clock, const BillingEngine& billing, EventSink sink) :
    cfg_(std::move(cfg)),
    clock_(clock),
    billing_(billing),
    sink_(std::move(sink)),
    queue_(cfg_.queue_capacity) {
}

void Pile::set_event_sink(EventSink sink) {
    sink_ = std::move(sink);
}

AdmissionResult Pile::submit(ChargeRequest request) {
    const auto now = clock_.now();
    if (request.arrival_instant == SimTime{}) {
        request.arrival_instant = now;
    }
    request.submission_seq = next_seq_++;

    AdmissionResult result = AdmissionResult::Accepted;
    if (closed_) {
        result = AdmissionResult::PileClosed;
    } else if (cfg_.enforce_charge_type && request.charge_type != cfg_.charge_type) {
        result = AdmissionResult::TypeMismatch;
    } else {
        result = queue_.enqueue(request);
    }

    if (result != AdmissionResult::Accepted) {
        EVLOG_warning << "[" << cfg_.id << "] Request " << request.id << " rejected (" << to_string(result)
                      << ") at " << clock_.format_local(now) << ", occupancy " << queue_.occupancy() << "/"
                      << queue_.capacity();
        emit(PileEventType::Rejected, ChargeSession(request), now, result);
        return result;
    }

    EVLOG_info << "[" << cfg_.id << "] Request " << request.id << " queued, occupancy " << queue_.occupancy() << "/"
               << queue_.capacity();
    emit(PileEventType::Queued, ChargeSession(request), now);
    promote_next(now);
    return result;
}

bool Pile::cancel(std::uint32_t request_id) {
    const auto now = clock_.now();
    const auto* active = queue_.active();
    if (active != nullptr && active->id() == request_id) {
        EVLOG_info << "[" << cfg_.id << "] Stop requested for charging session " << request_id;
        stop_active(now, SessionStatus::Completed);
        return true;
    }
    auto removed = queue_.cancel(request_id);
    if (!removed) {
        EVLOG_warning << "[" << cfg_.id << "] Cannot cancel unknown request " << request_id;
        return false;
    }
    EVLOG_info << "[" << cfg_.id << "] Waiting request " << request_id << " cancelled";
    emit(PileEventType::Cancelled, ChargeSession(*removed), now);
    return true;
}

bool Pile::interrupt() {
    if (!cfg_.allow_interruption) {
        EVLOG_warning << "[" << cfg_.id << "] Interruption is not allowed on this pile";
        return false;
    }
    if (!queue_.has_active()) {
        EVLOG_info << "[" << cfg_.id << "] Fault injected while idle, no session to interrupt";
        return false;
    }
    if (stop_active(clock_.now(), SessionStatus::Interrupted) != SessionStatus::Interrupted) {
        EVLOG_info << "[" << cfg_.id << "] Fault injected after the active session reached its target";
        return false;
    }
    EVLOG_error << "[" << cfg_.id << "] Simulated pile fault";
    return true;
}

void Pile::tick() {
    const auto now = clock_.now();
    if (auto* session = queue_.active()) {
        const auto step = billing_.bill(*session, now);
        if (step.target_reached) {
            session->complete(step.billed_until);
            auto done = queue_.release_active();
            EVLOG_info << "[" << cfg_.id << "] Session " << done->id() << " completed at "
                       << clock_.format_local(step.billed_until) << ": " << done->energy_delivered_kwh()
                       << " kWh, total " << done->total_cost();
            emit(PileEventType::Completed, *done, step.billed_until);
        } else {
            EVLOG_debug << "[" << cfg_.id << "] Session " << session->id() << " at " << clock_.format_local(now)
                        << ": " << session->energy_delivered_kwh() << " kWh, cost " << session->cost_accrued();
            emit(PileEventType::Progress, *session, now);
        }
    }
    promote_next(now);
}

void Pile::close() {
    if (closed_) {
        EVLOG_warning << "[" << cfg_.id << "] Pile already closed";
        return;
    }
    const auto now = clock_.now();
    closed_ = true;
    if (queue_.has_active()) {
        stop_active(now, SessionStatus::Completed);
    }
    for (const auto& request : queue_.drain_waiting()) {
        emit(PileEventType::Cancelled, ChargeSession(request), now);
    }
    EVLOG_info << "[" << cfg_.id << "] Pile closed at " << clock_.format_local(now);
}

void Pile::open() {
    if (!closed_) {
        EVLOG_warning << "[" << cfg_.id << "] Pile is not closed";
        return;
    }
    closed_ = false;
    EVLOG_info << "[" << cfg_.id << "] Pile reopened";
}

void Pile::promote_next(SimTime now) {
    if (closed_) {
        return;
    }
    if (auto* session = queue_.promote(now, cfg_.rated_power_kw)) {
        EVLOG_info << "[" << cfg_.id << "] Session " << session->id() << " started at " << clock_.format_local(now)
                   << " with " << session->power_kw() << " kW";
        emit(PileEventType::Admitted, *session, now);
    }
}

SessionStatus Pile::stop_active(SimTime now, SessionStatus outcome) {
    auto* session = queue_.active();
    const auto step = billing_.bill(*session, now);
    SimTime at = now;
    if (step.target_reached) {
        // Target was already met before the stop arrived.
        outcome = SessionStatus::Completed;
        at = step.billed_until;
    }
    PileEventType type = PileEventType::Completed;
    if (outcome == SessionStatus::Interrupted) {
        session->interrupt(at);
        type = PileEventType::Interrupted;
    } else {
        session->complete(at);
    }
    auto done = queue_.release_active();
    EVLOG_info << "[" << cfg_.id << "] Session " << done->id() << " " << to_string(done->status()) << " at "
               << clock_.format_local(at) << ": " << done->energy_delivered_kwh() << " kWh, total "
               << done->total_cost();
    emit(type, *done, at);
    return outcome;
}

void Pile::emit(PileEventType type, const ChargeSession& session, SimTime at, AdmissionResult reason) {
    if (!sink_) {
        return;
    }
    sink_(PileEvent{type, cfg_.id, at, session, reason});
}

const char* to_string(PileEventType type) {
    switch (type) {
    case PileEventType::Queued:
        return "queued";
    case PileEventType::Admitted:
        return "admitted";
    case PileEventType::Progress:
        return "progress";
    case PileEventType::Completed:
        return "completed";
    case PileEventType::Interrupted:
        return "interrupted";
    case PileEventType::Cancelled:
        return "cancelled";
    case PileEventType::Rejected:
        return "rejected";
    }
    return "unknown";
}

} // namespace pilesim
