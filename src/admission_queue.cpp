// SPDX-License-Identifier: Apache-2.0
#include "admission_queue.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace pilesim {

AdmissionQueue::AdmissionQueue(std::size_t capacity) : capacity_(capacity) {}

AdmissionResult AdmissionQueue::enqueue(ChargeRequest request) {
    if (contains(request.id)) {
        return AdmissionResult::DuplicateId;
    }
    if (full()) {
        return AdmissionResult::QueueFull;
    }
    // Arrival instant orders the line; equal instants keep submission order.
    auto pos = std::upper_bound(waiting_.begin(), waiting_.end(), request,
                                [](const ChargeRequest& a, const ChargeRequest& b) {
                                    if (a.arrival_instant != b.arrival_instant) {
                                        return a.arrival_instant < b.arrival_instant;
                                    }
                                    return a.submission_seq < b.submission_seq;
                                });
    waiting_.insert(pos, std::move(request));
    return AdmissionResult::Accepted;
}

ChargeSession* AdmissionQueue::promote(SimTime now, double rated_power_kw) {
    if (active_ || waiting_.empty()) {
        return nullptr;
    }
    ChargeRequest head = std::move(waiting_.front());
    waiting_.pop_front();
    double power = rated_power_kw;
    if (head.requested_power_kw > 0.0) {
        power = std::min(power, head.requested_power_kw);
    }
    active_.emplace(std::move(head));
    active_->start(now, power);
    return &*active_;
}

std::optional<ChargeRequest> AdmissionQueue::cancel(std::uint32_t request_id) {
    auto it = std::find_if(waiting_.begin(), waiting_.end(),
                           [&](const ChargeRequest& r) { return r.id == request_id; });
    if (it == waiting_.end()) {
        return std::nullopt;
    }
    ChargeRequest removed = std::move(*it);
    waiting_.erase(it);
    return removed;
}

std::optional<ChargeSession> AdmissionQueue::release_active() {
    if (!active_ || !active_->is_terminal()) {
        return std::nullopt;
    }
    std::optional<ChargeSession> released = std::move(active_);
    active_.reset();
    return released;
}

std::vector<ChargeRequest> AdmissionQueue::drain_waiting() {
    std::vector<ChargeRequest> drained(std::make_move_iterator(waiting_.begin()),
                                       std::make_move_iterator(waiting_.end()));
    waiting_.clear();
    return drained;
}

bool AdmissionQueue::contains(std::uint32_t request_id) const {
    if (active_ && active_->id() == request_id) {
        return true;
    }
    return std::any_of(waiting_.begin(), waiting_.end(),
                       [&](const ChargeRequest& r) { return r.id == request_id; });
}

const char* to_string(AdmissionResult result) {
    switch (result) {
    case AdmissionResult::Accepted:
        return "accepted";
    case AdmissionResult::QueueFull:
        return "queue_full";
    case AdmissionResult::DuplicateId:
        return "duplicate_id";
    case AdmissionResult::TypeMismatch:
        return "type_mismatch";
    case AdmissionResult::PileClosed:
        return "pile_closed";
    }
    return "unknown";
}

} // namespace pilesim
