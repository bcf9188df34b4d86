// SPDX-License-Identifier: Apache-2.0
#include "billing_engine.hpp"
#include "pile.hpp"
#include "pile_config.hpp"
#include "pile_driver.hpp"
#include "protocol_adapter.hpp"
#include "sim_clock.hpp"
#include "tariff.hpp"
#include "websocket_transport.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include <everest/logging.hpp>

namespace {
std::atomic<bool> keep_running{true};

void handle_signal(int) {
    keep_running = false;
}

std::string parse_config_path(int argc, char* argv[]) {
    std::string path = "configs/pile.json";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            path = argv[i + 1];
        }
    }
    return path;
}

// Operator console: "p" faults the only pile, "p <pile-id>" a specific one.
void console_loop(pilesim::ProtocolAdapter& adapter) {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    while (keep_running) {
        const int ready = ::poll(&pfd, 1, 200);
        if (ready <= 0 || (pfd.revents & POLLIN) == 0) {
            if (ready > 0 && (pfd.revents & (POLLHUP | POLLERR)) != 0) {
                return;
            }
            continue;
        }
        std::string line;
        if (!std::getline(std::cin, line)) {
            EVLOG_debug << "Console input closed";
            return;
        }
        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || (line[first] != 'p' && line[first] != 'P')) {
            continue;
        }
        std::string pile_id;
        const auto arg = line.find_first_not_of(" \t", first + 1);
        if (arg != std::string::npos) {
            pile_id = line.substr(arg, line.find_last_not_of(" \t\r") - arg + 1);
        }
        adapter.inject_fault(pile_id);
    }
}
} // namespace

int main(int argc, char* argv[]) {
    const auto config_path = parse_config_path(argc, argv);

    pilesim::PileSimConfig cfg;
    try {
        cfg = pilesim::load_pile_sim_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    Everest::Logging::init(cfg.logging_config.string(), "pilesim");
    for (const auto& warning : cfg.warnings) {
        EVLOG_warning << warning;
    }

    std::optional<pilesim::TariffTable> tariff;
    std::optional<pilesim::SimulatedClock> clock;
    try {
        tariff.emplace(pilesim::load_tariff(cfg.price_path));
        clock.emplace(cfg.clock);
    } catch (const std::exception& e) {
        EVLOG_error << "Startup failed: " << e.what();
        std::cerr << "Startup failed: " << e.what() << std::endl;
        return 1;
    }
    EVLOG_info << "Simulated time starts at " << clock->format_local(clock->start_instant()) << ", speed x"
               << clock->speed_multiplier() << ", " << clock->simulated_per_tick().count() << " ms per tick";

    pilesim::BillingEngine billing(*tariff, *clock);
    auto transport = std::make_shared<pilesim::WebsocketTransport>(cfg.websocket_url, cfg.connect_timeout);
    pilesim::ProtocolAdapter adapter(transport, *clock);

    std::vector<std::unique_ptr<pilesim::Pile>> piles;
    std::vector<std::unique_ptr<pilesim::PileDriver>> drivers;
    for (const auto& pile_cfg : cfg.piles) {
        piles.push_back(std::make_unique<pilesim::Pile>(pile_cfg, *clock, billing));
        drivers.push_back(std::make_unique<pilesim::PileDriver>(*piles.back(), clock->polling_interval()));
        adapter.attach(*piles.back(), *drivers.back());
        EVLOG_info << "[" << pile_cfg.id << "] " << pilesim::to_string(pile_cfg.charge_type) << " pile, "
                   << pile_cfg.rated_power_kw << " kW, queue " << pile_cfg.queue_capacity
                   << (pile_cfg.allow_interruption ? ", interruptible (type 'p' to simulate a fault)"
                                                   : ", not interruptible");
    }

    adapter.bind();
    transport->register_connection_state_callback([&adapter](bool connected) {
        if (connected) {
            adapter.send_register();
        } else {
            keep_running = false;
        }
    });

    for (auto& driver : drivers) {
        driver->start();
    }
    if (!transport->start()) {
        std::cerr << "Failed to connect to " << cfg.websocket_url << std::endl;
        for (auto& driver : drivers) {
            driver->stop();
        }
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::thread console([&adapter]() { console_loop(adapter); });

    while (keep_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    EVLOG_info << "Shutting down";
    keep_running = false;
    console.join();
    for (auto& driver : drivers) {
        driver->stop();
    }
    transport->stop();
    return 0;
}
