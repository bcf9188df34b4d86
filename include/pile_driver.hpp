// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "pile.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace pilesim {

/// \brief Worker thread that owns every mutation of one pile.
///
/// Posted operations run in arrival order on the worker; between them the worker calls Pile::tick() once per
/// tick interval (real time). An exception thrown by an operation or a tick is logged and the loop keeps going.
class PileDriver {
public:
    using Operation = std::function<void(Pile&)>;

    PileDriver(Pile& pile, std::chrono::milliseconds tick_interval);
    ~PileDriver();

    PileDriver(const PileDriver&) = delete;
    PileDriver& operator=(const PileDriver&) = delete;

    void start();
    void stop();

    /// \brief Queue \p op for the worker. Operations posted while stopped are dropped.
    void post(Operation op);

    bool running() const { return running_; }
    const std::string& pile_id() const { return pile_.id(); }

private:
    Pile& pile_;
    std::chrono::milliseconds tick_interval_;
    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Operation> ops_;

    void loop();
};

} // namespace pilesim
