// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "pile.hpp"
#include "sim_clock.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace pilesim {

namespace fs = std::filesystem;

struct PileSimConfig {
    fs::path price_path;
    std::vector<PileConfig> piles;
    std::string websocket_url{"ws://localhost:8080/ws"};
    std::chrono::seconds connect_timeout{10};
    ClockConfig clock;
    fs::path logging_config;
    std::vector<std::string> warnings; // logged once logging is up
};

/// \brief Load pile.json, resolving relative paths against its directory.
/// \throws std::runtime_error when the file is missing, ConfigurationError for invalid values.
PileSimConfig load_pile_sim_config(const fs::path& config_path);

/// \brief Random pile id of the form pile-<hex>.
std::string make_pile_id();

} // namespace pilesim
