// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "sim_clock.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace pilesim {

enum class ChargeType { Fast, Slow };

enum class SessionStatus { Queued, Charging, Completed, Interrupted };

struct ChargeRequest {
    std::uint32_t id{0};
    ChargeType charge_type{ChargeType::Fast};
    double requested_power_kw{0.0}; // 0 => pile rated power
    double target_energy_kwh{0.0};  // 0 => charge until explicitly stopped
    SimTime arrival_instant{};
    std::uint64_t submission_seq{0}; // tie-break for identical arrival instants
};

/// \brief Lifecycle of one admitted request: Queued -> Charging -> Completed | Interrupted.
/// Accrued values only move while Charging and are frozen afterwards.
class ChargeSession {
public:
    explicit ChargeSession(ChargeRequest request);

    /// \brief Queued -> Charging. \throws std::logic_error from any other state.
    void start(SimTime now, double power_kw);

    /// \brief Add billed energy/cost for an interval ending at \p billed_until. Ignored once the session left
    /// Charging, so terminal values cannot drift.
    void accrue(double energy_kwh, double cost, double service_fee_rate, SimTime billed_until);

    /// \brief Charging -> Completed. \throws std::logic_error from any other state.
    void complete(SimTime at);
    /// \brief Charging -> Interrupted. \throws std::logic_error from any other state.
    void interrupt(SimTime at);

    const ChargeRequest& request() const { return request_; }
    std::uint32_t id() const { return request_.id; }
    SessionStatus status() const { return status_; }
    bool is_charging() const { return status_ == SessionStatus::Charging; }
    bool is_terminal() const {
        return status_ == SessionStatus::Completed || status_ == SessionStatus::Interrupted;
    }

    double power_kw() const { return power_kw_; }
    double energy_delivered_kwh() const { return energy_delivered_kwh_; }
    double cost_accrued() const { return cost_accrued_; }
    double service_fee_total() const { return service_fee_total_; }
    double total_cost() const { return cost_accrued_ + service_fee_total_; }
    double remaining_energy_kwh() const;
    bool has_target() const { return request_.target_energy_kwh > 0.0; }

    std::optional<SimTime> session_start() const { return session_start_; }
    std::optional<SimTime> last_billed_instant() const { return last_billed_; }
    std::optional<SimTime> end_instant() const { return end_; }

    /// \brief Instant the energy target is reached at the current power, if a target is set and charging.
    std::optional<SimTime> estimated_completion() const;

private:
    ChargeRequest request_;
    SessionStatus status_{SessionStatus::Queued};
    double power_kw_{0.0};
    double energy_delivered_kwh_{0.0};
    double cost_accrued_{0.0};
    double service_fee_total_{0.0};
    std::optional<SimTime> session_start_;
    std::optional<SimTime> last_billed_;
    std::optional<SimTime> end_;

    void require_charging(const char* transition) const;
};

const char* to_string(SessionStatus status);
const char* to_string(ChargeType type);
/// \brief "F"/"T" wire codes; the long names "fast"/"slow" are accepted too.
std::optional<ChargeType> charge_type_from_string(const std::string& s);

} // namespace pilesim
