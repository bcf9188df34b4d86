// SPDX-License-Identifier: Apache-2.0
#include "errors.hpp"
#include "sim_clock.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

using namespace pilesim;
using namespace std::chrono_literals;

namespace {

struct ManualTime {
    std::chrono::steady_clock::time_point now{};
};

ClockConfig make_cfg(const std::string& zone, std::int64_t speed, const std::string& start) {
    ClockConfig cfg;
    cfg.time_zone = zone;
    cfg.speed_multiplier = speed;
    cfg.start_instant = parse_instant(start, resolve_zone(zone));
    cfg.polling_interval = 5000ms;
    return cfg;
}

template <typename F> bool throws_config_error(F&& f) {
    try {
        f();
    } catch (const ConfigurationError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    ManualTime real;
    auto source = [&real]() { return real.now; };

    // Speed scales simulated time, not the polling interval.
    {
        SimulatedClock clock(make_cfg("UTC", 10, "2025-06-01T06:30:00Z"), source);
        assert(clock.polling_interval() == 5000ms);
        assert(clock.simulated_per_tick() == 50s);
        const auto start = clock.now();
        assert(start == clock.start_instant());
        real.now += 5000ms;
        assert(clock.now() - start == 50s);
        real.now += 250ms;
        assert(clock.now() - start == 52500ms);
    }

    // Offsets and local rendering.
    {
        SimulatedClock clock(make_cfg("Asia/Shanghai", 1, "2025-06-01T06:30:00+08:00"), source);
        const auto t = clock.start_instant();
        assert(clock.time_of_day(t) == 6h + 30min);
        assert(to_rfc3339(t) == "2025-05-31T22:30:00.000Z");
        assert(clock.next_time_of_day(t, 7h) == t + 30min);
        assert(clock.next_time_of_day(t, 6h + 30min) == t + 24h);
        assert(clock.next_time_of_day(t, 24h) == t + 17h + 30min);

        // Offset-less text is local time in the zone.
        assert(parse_instant("2025-06-01 06:30:00", clock.zone()) == t);
        assert(parse_instant("2025-06-01T06:30:00", clock.zone()) == t);
        assert(parse_instant("2025-05-31T22:30:00Z", nullptr) == t);
    }

    // Spring-forward day: 02:00-03:00 local does not exist, so 01:00 EST to 07:00 EDT is five hours.
    {
        SimulatedClock clock(make_cfg("America/New_York", 1, "2025-03-09T06:00:00Z"), source);
        const auto t = clock.start_instant();
        assert(clock.time_of_day(t) == 1h);
        assert(clock.next_time_of_day(t, 7h) == t + 5h);
        assert(clock.time_of_day(t + 2h) == 4h);
    }

    // Invalid configuration.
    {
        assert(throws_config_error([&]() { SimulatedClock(make_cfg("UTC", 0, "2025-06-01T00:00:00Z"), source); }));
        assert(throws_config_error([&]() { SimulatedClock(make_cfg("UTC", -3, "2025-06-01T00:00:00Z"), source); }));
        assert(throws_config_error([&]() { resolve_zone("Mars/Olympus_Mons"); }));
        assert(throws_config_error([&]() {
            auto cfg = make_cfg("UTC", 1, "2025-06-01T00:00:00Z");
            cfg.polling_interval = 0ms;
            SimulatedClock clock(cfg, source);
        }));
        assert(throws_config_error([&]() { parse_instant("yesterday at noon", resolve_zone("UTC")); }));
        assert(throws_config_error([&]() { parse_instant("2025-06-01 06:30:00", nullptr); }));
        assert(throws_config_error([&]() { parse_instant("2025-06-01T06:30:00Zjunk", nullptr); }));
    }

    // Without an explicit start the clock starts at the real instant.
    {
        ClockConfig cfg;
        cfg.time_zone = "UTC";
        const auto before = std::chrono::system_clock::now() - 1s;
        SimulatedClock clock(cfg);
        assert(clock.start_instant() >= before);
        assert(clock.start_instant() <= std::chrono::system_clock::now() + 1s);
    }

    std::cout << "Simulated clock tests passed\n";
    return 0;
}
