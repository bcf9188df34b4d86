// SPDX-License-Identifier: Apache-2.0
#include "pile_driver.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace pilesim;
using namespace std::chrono_literals;

namespace {

struct SharedLog {
    std::mutex mutex;
    std::vector<PileEvent> events;

    std::size_t count(PileEventType type) {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (const auto& e : events) {
            n += e.type == type ? 1 : 0;
        }
        return n;
    }
};

template <typename Pred> bool wait_for(Pred pred, std::chrono::milliseconds limit = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

void flush(PileDriver& driver) {
    std::promise<void> done;
    auto fut = done.get_future();
    driver.post([&done](Pile&) { done.set_value(); });
    assert(fut.wait_for(3s) == std::future_status::ready);
}

} // namespace

int main() {
    ClockConfig clock_cfg;
    clock_cfg.time_zone = "UTC";
    clock_cfg.speed_multiplier = 60;
    clock_cfg.polling_interval = 20ms;
    SimulatedClock clock(clock_cfg);
    const auto tariff = TariffTable::defaults();
    BillingEngine billing(tariff, clock);

    SharedLog log;
    PileConfig pile_cfg;
    pile_cfg.id = "driver-test";
    pile_cfg.queue_capacity = 2;
    Pile pile(pile_cfg, clock, billing, [&log](const PileEvent& e) {
        std::lock_guard<std::mutex> lock(log.mutex);
        log.events.push_back(e);
    });

    PileDriver driver(pile, clock.polling_interval());
    assert(!driver.running());
    driver.start();
    assert(driver.running());

    // Operations run in the order they were posted.
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        driver.post([&order, i](Pile&) { order.push_back(i); });
    }
    flush(driver);
    assert((order == std::vector<int>{0, 1, 2, 3, 4}));

    // Submission goes through the worker; ticks then report progress.
    ChargeRequest request;
    request.id = 7;
    driver.post([request](Pile& p) { p.submit(request); });
    assert(wait_for([&]() { return log.count(PileEventType::Admitted) == 1; }));
    assert(wait_for([&]() { return log.count(PileEventType::Progress) >= 3; }));

    // Progress is monotonic.
    {
        std::lock_guard<std::mutex> lock(log.mutex);
        double last_energy = 0.0;
        SimTime last_at{};
        for (const auto& e : log.events) {
            if (e.type != PileEventType::Progress) {
                continue;
            }
            assert(e.session.energy_delivered_kwh() >= last_energy);
            assert(e.at >= last_at);
            last_energy = e.session.energy_delivered_kwh();
            last_at = e.at;
        }
    }

    // A failing operation is logged and the driver keeps going.
    driver.post([](Pile&) { throw std::runtime_error("boom"); });
    bool after_failure = false;
    driver.post([&after_failure](Pile&) { after_failure = true; });
    flush(driver);
    assert(after_failure);
    assert(driver.running());

    driver.post([](Pile& p) { p.cancel(7); });
    assert(wait_for([&]() { return log.count(PileEventType::Completed) == 1; }));

    driver.stop();
    assert(!driver.running());
    const auto events_after_stop = log.count(PileEventType::Progress);
    driver.post([](Pile& p) { p.tick(); });
    std::this_thread::sleep_for(50ms);
    assert(log.count(PileEventType::Progress) == events_after_stop);
    driver.stop();

    std::cout << "Pile driver tests passed\n";
    return 0;
}
