// SPDX-License-Identifier: Apache-2.0
#include "pile_driver.hpp"

#include <utility>

#include <everest/logging.hpp>

namespace pilesim {

PileDriver::PileDriver(Pile& pile, std::chrono::milliseconds tick_interval) :
    pile_(pile), tick_interval_(tick_interval) {
}

PileDriver::~PileDriver() {
    stop();
}

void PileDriver::start() {
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::thread([this]() { loop(); });
    EVLOG_info << "[" << pile_.id() << "] Driver started, tick every " << tick_interval_.count() << " ms";
}

void PileDriver::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ops_.empty()) {
        EVLOG_debug << "[" << pile_.id() << "] Dropping " << ops_.size() << " pending operation(s) on stop";
        ops_.clear();
    }
    EVLOG_info << "[" << pile_.id() << "] Driver stopped";
}

void PileDriver::post(Operation op) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            EVLOG_warning << "[" << pile_.id() << "] Driver not running, operation dropped";
            return;
        }
        ops_.push_back(std::move(op));
    }
    cv_.notify_one();
}

void PileDriver::loop() {
    auto next_tick = std::chrono::steady_clock::now() + tick_interval_;
    while (running_) {
        std::deque<Operation> batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_until(lock, next_tick, [this]() { return !running_ || !ops_.empty(); });
            if (!running_) {
                break;
            }
            batch.swap(ops_);
        }

        for (auto& op : batch) {
            try {
                op(pile_);
            } catch (const std::exception& e) {
                EVLOG_warning << "[" << pile_.id() << "] Operation error: " << e.what();
            }
        }

        const auto now = std::chrono::steady_clock::now();
        if (now < next_tick) {
            continue;
        }
        try {
            pile_.tick();
        } catch (const std::exception& e) {
            EVLOG_warning << "[" << pile_.id() << "] Tick error: " << e.what();
        }
        next_tick += tick_interval_;
        if (next_tick <= now) {
            // Fell behind; simulated time is read from the clock, so skipped ticks lose nothing.
            next_tick = now + tick_interval_;
        }
    }
}

} // namespace pilesim
