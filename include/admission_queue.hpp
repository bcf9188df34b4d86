// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "charge_session.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace pilesim {

enum class AdmissionResult { Accepted, QueueFull, DuplicateId, TypeMismatch, PileClosed };

/// \brief Fixed-capacity FIFO of one pile plus its single active session.
/// waiting.size() + (active ? 1 : 0) never exceeds capacity.
class AdmissionQueue {
public:
    explicit AdmissionQueue(std::size_t capacity);

    /// \brief Admit \p request behind every request that arrived before it. No partial admission.
    AdmissionResult enqueue(ChargeRequest request);

    /// \brief Move the head of the waiting line into the active slot (Queued -> Charging).
    /// \returns the newly active session, or nullptr when a session is already active or nothing waits.
    ChargeSession* promote(SimTime now, double rated_power_kw);

    /// \brief Remove a waiting request by id. The active session is never touched here.
    std::optional<ChargeRequest> cancel(std::uint32_t request_id);

    /// \brief Take the active session out of the slot once it reached a terminal state.
    std::optional<ChargeSession> release_active();

    /// \brief Remove and return every waiting request in queue order.
    std::vector<ChargeRequest> drain_waiting();

    ChargeSession* active() { return active_ ? &*active_ : nullptr; }
    const ChargeSession* active() const { return active_ ? &*active_ : nullptr; }
    bool has_active() const { return active_.has_value(); }
    bool contains(std::uint32_t request_id) const;

    const std::deque<ChargeRequest>& waiting() const { return waiting_; }
    std::size_t capacity() const { return capacity_; }
    std::size_t occupancy() const { return waiting_.size() + (active_ ? 1 : 0); }
    bool full() const { return occupancy() >= capacity_; }

private:
    std::size_t capacity_;
    std::deque<ChargeRequest> waiting_;
    std::optional<ChargeSession> active_;
};

const char* to_string(AdmissionResult result);

} // namespace pilesim
