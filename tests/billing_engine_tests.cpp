// SPDX-License-Identifier: Apache-2.0
#include "billing_engine.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>

using namespace pilesim;
using namespace std::chrono_literals;

namespace {

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

SimulatedClock make_clock(const std::string& start) {
    ClockConfig cfg;
    cfg.time_zone = "UTC";
    cfg.start_instant = parse_instant(start, nullptr);
    // Billing only reads the zone; the real-time source stays frozen.
    return SimulatedClock(cfg, []() { return std::chrono::steady_clock::time_point{}; });
}

ChargeSession charging(std::uint32_t id, double target, SimTime start, double power) {
    ChargeRequest r;
    r.id = id;
    r.target_energy_kwh = target;
    ChargeSession s(r);
    s.start(start, power);
    return s;
}

} // namespace

int main() {
    const auto tariff = TariffTable::defaults();
    const auto clock = make_clock("2025-06-01T06:30:00Z");
    BillingEngine engine(tariff, clock);
    const auto t0 = clock.start_instant();

    // 06:30-07:30 at 30 kW crosses the 07:00 valley/flat boundary.
    {
        auto s = charging(1, 0.0, t0, 30.0);
        const auto step = engine.bill(s, t0 + 1h);
        assert(!step.target_reached);
        assert(step.billed_until == t0 + 1h);
        assert(near(s.energy_delivered_kwh(), 30.0));
        assert(near(s.cost_accrued(), 15 * 0.4 + 15 * 0.7));
        assert(near(s.service_fee_total(), 30 * 0.8));
        assert(near(s.total_cost(), 16.5 + 24.0));

        // Same instant again adds nothing.
        const auto again = engine.bill(s, t0 + 1h);
        assert(again.energy_kwh == 0.0 && again.cost == 0.0);
        assert(near(s.total_cost(), 40.5));
    }

    // Splitting the interval into arbitrary ticks gives the same totals.
    {
        auto whole = charging(2, 0.0, t0, 22.0);
        engine.bill(whole, t0 + 5h);
        auto ticked = charging(3, 0.0, t0, 22.0);
        for (auto t = t0 + 7min; t < t0 + 5h; t += 7min) {
            engine.bill(ticked, t);
        }
        engine.bill(ticked, t0 + 5h);
        assert(near(whole.energy_delivered_kwh(), ticked.energy_delivered_kwh(), 1e-6));
        assert(near(whole.cost_accrued(), ticked.cost_accrued(), 1e-6));
        assert(near(whole.total_cost(), ticked.total_cost(), 1e-6));
    }

    // Energy target inside the interval clips billing at the instant it is reached.
    {
        auto s = charging(4, 10.0, t0, 30.0);
        const auto step = engine.bill(s, t0 + 1h);
        assert(step.target_reached);
        assert(step.billed_until == t0 + 20min);
        assert(s.energy_delivered_kwh() == 10.0);
        assert(near(s.cost_accrued(), 10 * 0.4));
        assert(s.last_billed_instant() == t0 + 20min);
    }

    // A frozen session never moves.
    {
        auto s = charging(5, 0.0, t0, 30.0);
        engine.bill(s, t0 + 10min);
        s.interrupt(t0 + 10min);
        const auto frozen = s.total_cost();
        const auto step = engine.bill(s, t0 + 2h);
        assert(step.energy_kwh == 0.0);
        assert(s.total_cost() == frozen);
        assert(near(s.energy_delivered_kwh(), 5.0));
    }

    // Costs wrap past midnight.
    {
        const auto late = parse_instant("2025-06-01T22:30:00Z", nullptr);
        assert(near(engine.cost_between(late, late + 1h, 10.0), 5 * 0.7 + 5 * 0.4));
        int segments = 0;
        engine.for_each_segment(late, late + 9h, [&](SimTime a, SimTime b, double) {
            assert(a < b);
            ++segments;
        });
        // 22:30-23:00, 23:00-24:00, 00:00-07:00, 07:00-07:30
        assert(segments == 4);
    }

    std::cout << "Billing engine tests passed\n";
    return 0;
}
