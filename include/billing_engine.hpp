// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "charge_session.hpp"
#include "sim_clock.hpp"
#include "tariff.hpp"

#include <functional>

namespace pilesim {

/// \brief Result of one billing pass over [last_billed_instant, billed_until).
struct BillingStep {
    double energy_kwh{0.0};
    double cost{0.0};
    bool target_reached{false};
    SimTime billed_until{};
};

/// \brief Integrates power draw against the time-of-day tariff as simulated time advances.
///
/// Stateless apart from its references to the shared, read-only tariff and clock, so one engine may serve every
/// pile from any thread.
class BillingEngine {
public:
    using SegmentVisitor = std::function<void(SimTime from, SimTime to, double price)>;

    BillingEngine(const TariffTable& tariff, const SimulatedClock& clock);

    /// \brief Bill \p session up to \p now, splitting at every tariff boundary crossed.
    /// When the energy target falls inside the interval, billing stops at the instant it is reached.
    /// Re-running with an unchanged \p now adds nothing.
    BillingStep bill(ChargeSession& session, SimTime now) const;

    /// \brief Tariff cost of drawing \p power_kw over [from, to), without service fee.
    double cost_between(SimTime from, SimTime to, double power_kw) const;

    /// \brief Visit the contiguous sub-intervals of [from, to) that each lie inside one tariff period.
    void for_each_segment(SimTime from, SimTime to, const SegmentVisitor& visit) const;

    const TariffTable& tariff() const { return tariff_; }

private:
    const TariffTable& tariff_;
    const SimulatedClock& clock_;
};

} // namespace pilesim
