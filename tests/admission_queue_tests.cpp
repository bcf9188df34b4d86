// SPDX-License-Identifier: Apache-2.0
#include "admission_queue.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <random>
#include <stdexcept>
#include <vector>

using namespace pilesim;
using namespace std::chrono_literals;

namespace {

const SimTime T0 = SimTime{} + std::chrono::hours(24 * 20000);

ChargeRequest make_request(std::uint32_t id, SimTime arrival, std::uint64_t seq,
                           ChargeType type = ChargeType::Fast, double power = 0.0) {
    ChargeRequest r;
    r.id = id;
    r.charge_type = type;
    r.requested_power_kw = power;
    r.target_energy_kwh = 10.0;
    r.arrival_instant = arrival;
    r.submission_seq = seq;
    return r;
}

} // namespace

int main() {
    // Capacity counts the active session; no partial admission.
    {
        AdmissionQueue q(2);
        assert(q.enqueue(make_request(1, T0, 0)) == AdmissionResult::Accepted);
        assert(q.promote(T0, 30.0) != nullptr);
        assert(q.enqueue(make_request(2, T0, 1)) == AdmissionResult::Accepted);
        assert(q.full());
        assert(q.enqueue(make_request(3, T0, 2)) == AdmissionResult::QueueFull);
        assert(q.occupancy() == 2);
        assert(q.waiting().size() == 1);
        assert(q.enqueue(make_request(2, T0, 3)) == AdmissionResult::DuplicateId);
        assert(q.enqueue(make_request(1, T0, 4)) == AdmissionResult::DuplicateId);
    }

    // Order is by arrival instant, ties by submission order, never by charge type.
    {
        AdmissionQueue q(5);
        assert(q.enqueue(make_request(1, T0 + 10s, 0, ChargeType::Slow)) == AdmissionResult::Accepted);
        assert(q.enqueue(make_request(2, T0 + 5s, 1, ChargeType::Fast)) == AdmissionResult::Accepted);
        assert(q.enqueue(make_request(3, T0 + 10s, 2, ChargeType::Fast)) == AdmissionResult::Accepted);
        assert(q.enqueue(make_request(4, T0 + 5s, 3, ChargeType::Slow)) == AdmissionResult::Accepted);
        std::vector<std::uint32_t> order;
        for (const auto& r : q.waiting()) {
            order.push_back(r.id);
        }
        assert((order == std::vector<std::uint32_t>{2, 4, 1, 3}));
    }

    // Promotion takes the head, starts it at now and caps power at the rating.
    {
        AdmissionQueue q(3);
        q.enqueue(make_request(1, T0, 0, ChargeType::Fast, 50.0));
        q.enqueue(make_request(2, T0, 1, ChargeType::Fast, 7.0));
        auto* s = q.promote(T0 + 1min, 30.0);
        assert(s != nullptr && s->id() == 1);
        assert(s->is_charging());
        assert(s->power_kw() == 30.0);
        assert(s->session_start() == T0 + 1min);
        assert(q.promote(T0 + 2min, 30.0) == nullptr);

        // A charging session cannot be released or cancelled through the waiting line.
        assert(!q.release_active().has_value());
        assert(!q.cancel(1).has_value());
        assert(q.has_active());

        q.active()->complete(T0 + 3min);
        auto done = q.release_active();
        assert(done.has_value() && done->status() == SessionStatus::Completed);
        assert(!q.has_active());

        auto* next = q.promote(T0 + 3min, 30.0);
        assert(next != nullptr && next->id() == 2);
        assert(next->power_kw() == 7.0);
    }

    // Cancel and drain remove only waiting requests.
    {
        AdmissionQueue q(4);
        q.enqueue(make_request(1, T0, 0));
        q.promote(T0, 30.0);
        q.enqueue(make_request(2, T0, 1));
        q.enqueue(make_request(3, T0, 2));
        q.enqueue(make_request(4, T0, 3));
        auto removed = q.cancel(3);
        assert(removed.has_value() && removed->id == 3);
        assert(!q.cancel(3).has_value());
        assert(q.occupancy() == 3);
        auto drained = q.drain_waiting();
        assert(drained.size() == 2 && drained[0].id == 2 && drained[1].id == 4);
        assert(q.waiting().empty());
        assert(q.has_active());
        assert(q.occupancy() == 1);
    }

    // Invalid transitions are programming errors.
    {
        ChargeSession s(make_request(9, T0, 0));
        bool threw = false;
        try {
            s.complete(T0);
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
        s.start(T0, 30.0);
        s.interrupt(T0 + 1min);
        threw = false;
        try {
            s.start(T0 + 2min, 30.0);
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
    }

    // Capacity invariant under a random mix of operations.
    {
        std::mt19937 gen(42);
        std::uniform_int_distribution<int> op_dist(0, 3);
        std::uniform_int_distribution<std::uint32_t> id_dist(1, 12);
        AdmissionQueue q(3);
        std::uint64_t seq = 0;
        SimTime now = T0;
        for (int i = 0; i < 2000; ++i) {
            now += 1s;
            switch (op_dist(gen)) {
            case 0: {
                const auto before = q.occupancy();
                const auto result = q.enqueue(make_request(id_dist(gen), now, seq++));
                assert(q.occupancy() == before + (result == AdmissionResult::Accepted ? 1 : 0));
                break;
            }
            case 1:
                q.cancel(id_dist(gen));
                break;
            case 2:
                q.promote(now, 30.0);
                break;
            case 3:
                if (auto* s = q.active()) {
                    s->complete(now);
                    assert(q.release_active().has_value());
                }
                break;
            }
            assert(q.occupancy() <= q.capacity());
            assert(q.waiting().size() + (q.has_active() ? 1u : 0u) == q.occupancy());
        }
    }

    assert(std::string(to_string(AdmissionResult::QueueFull)) == "queue_full");
    assert(std::string(to_string(AdmissionResult::PileClosed)) == "pile_closed");
    assert(charge_type_from_string("T") == ChargeType::Slow);
    assert(charge_type_from_string("fast") == ChargeType::Fast);
    assert(!charge_type_from_string("X").has_value());

    std::cout << "Admission queue tests passed\n";
    return 0;
}
