// SPDX-License-Identifier: Apache-2.0
#include "billing_engine.hpp"

#include <algorithm>
#include <chrono>

namespace pilesim {

namespace {

double to_hours(std::chrono::milliseconds d) {
    return std::chrono::duration<double, std::ratio<3600>>(d).count();
}

} // namespace

BillingEngine::BillingEngine(const TariffTable& tariff, const SimulatedClock& clock) :
    tariff_(tariff), clock_(clock) {}

BillingStep BillingEngine::bill(ChargeSession& session, SimTime now) const {
    BillingStep step;
    if (!session.is_charging() || !session.last_billed_instant()) {
        return step;
    }
    const SimTime from = *session.last_billed_instant();
    step.billed_until = from;
    if (now <= from) {
        return step;
    }

    SimTime to = now;
    const auto completion = session.estimated_completion();
    if (completion && *completion <= now) {
        to = std::max(*completion, from);
        step.target_reached = true;
    }

    const double power = session.power_kw();
    for_each_segment(from, to, [&](SimTime a, SimTime b, double price) {
        const double energy = power * to_hours(b - a);
        step.energy_kwh += energy;
        step.cost += energy * price;
    });
    if (step.target_reached) {
        // Snap to the target; the completion instant is rounded up to whole milliseconds.
        step.energy_kwh = session.remaining_energy_kwh();
    }

    session.accrue(step.energy_kwh, step.cost, tariff_.service_fee(), to);
    step.billed_until = to;
    return step;
}

double BillingEngine::cost_between(SimTime from, SimTime to, double power_kw) const {
    double cost = 0.0;
    for_each_segment(from, to, [&](SimTime a, SimTime b, double price) { cost += power_kw * to_hours(b - a) * price; });
    return cost;
}

void BillingEngine::for_each_segment(SimTime from, SimTime to, const SegmentVisitor& visit) const {
    SimTime cur = from;
    while (cur < to) {
        const auto& period = tariff_.period_at(clock_.time_of_day(cur));
        const SimTime boundary = clock_.next_time_of_day(cur, period.end);
        const SimTime seg_end = std::min(boundary, to);
        visit(cur, seg_end, period.price);
        cur = seg_end;
    }
}

} // namespace pilesim
