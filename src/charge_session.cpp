// SPDX-License-Identifier: Apache-2.0
#include "charge_session.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace pilesim {

ChargeSession::ChargeSession(ChargeRequest request) : request_(std::move(request)) {}

void ChargeSession::start(SimTime now, double power_kw) {
    if (status_ != SessionStatus::Queued) {
        throw std::logic_error("Session " + std::to_string(request_.id) + " cannot start from state " +
                               to_string(status_));
    }
    session_start_ = now;
    last_billed_ = now;
    power_kw_ = power_kw;
    status_ = SessionStatus::Charging;
}

void ChargeSession::accrue(double energy_kwh, double cost, double service_fee_rate, SimTime billed_until) {
    if (status_ != SessionStatus::Charging) {
        return;
    }
    energy_delivered_kwh_ += std::max(0.0, energy_kwh);
    cost_accrued_ += std::max(0.0, cost);
    service_fee_total_ = energy_delivered_kwh_ * service_fee_rate;
    if (!last_billed_ || billed_until > *last_billed_) {
        last_billed_ = billed_until;
    }
}

void ChargeSession::complete(SimTime at) {
    require_charging("complete");
    end_ = at;
    status_ = SessionStatus::Completed;
}

void ChargeSession::interrupt(SimTime at) {
    require_charging("interrupt");
    end_ = at;
    status_ = SessionStatus::Interrupted;
}

double ChargeSession::remaining_energy_kwh() const {
    if (!has_target()) {
        return 0.0;
    }
    return std::max(0.0, request_.target_energy_kwh - energy_delivered_kwh_);
}

std::optional<SimTime> ChargeSession::estimated_completion() const {
    if (!is_charging() || !has_target() || power_kw_ <= 0.0 || !last_billed_) {
        return std::nullopt;
    }
    const double remaining_ms = remaining_energy_kwh() * 3600.0 * 1000.0 / power_kw_;
    // Round up to the millisecond, ignoring float noise below a nanosecond.
    return *last_billed_ + std::chrono::milliseconds(static_cast<std::int64_t>(std::ceil(remaining_ms - 1e-6)));
}

void ChargeSession::require_charging(const char* transition) const {
    if (status_ != SessionStatus::Charging) {
        throw std::logic_error(std::string("Session ") + std::to_string(request_.id) + " cannot " + transition +
                               " from state " + to_string(status_));
    }
}

const char* to_string(SessionStatus status) {
    switch (status) {
    case SessionStatus::Queued:
        return "waiting";
    case SessionStatus::Charging:
        return "charging";
    case SessionStatus::Completed:
        return "completed";
    case SessionStatus::Interrupted:
        return "interrupted";
    }
    return "unknown";
}

const char* to_string(ChargeType type) {
    return type == ChargeType::Fast ? "F" : "T";
}

std::optional<ChargeType> charge_type_from_string(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "f" || lower == "fast") {
        return ChargeType::Fast;
    }
    if (lower == "t" || lower == "slow") {
        return ChargeType::Slow;
    }
    return std::nullopt;
}

} // namespace pilesim
