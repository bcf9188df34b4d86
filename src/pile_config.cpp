// SPDX-License-Identifier: Apache-2.0
#include "pile_config.hpp"
#include "errors.hpp"

#include <cstdint>
#include <fstream>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace pilesim {

namespace {
fs::path make_absolute(const fs::path& base, const fs::path& relative_or_absolute) {
    if (relative_or_absolute.is_absolute()) {
        return relative_or_absolute;
    }
    return fs::weakly_canonical(base / relative_or_absolute);
}

// Whole-number settings; a fractional value is an error rather than being truncated.
std::int64_t integer_value(const nlohmann::json& obj, const char* key, std::int64_t fallback, const std::string& path) {
    if (!obj.contains(key)) {
        return fallback;
    }
    const auto& value = obj.at(key);
    if (!value.is_number_integer()) {
        throw ConfigurationError(path + " must be an integer, got " + value.dump());
    }
    return value.get<std::int64_t>();
}

ChargeType parse_charge_type(const std::string& name) {
    const auto type = charge_type_from_string(name);
    if (!type) {
        throw ConfigurationError("Unknown chargeType '" + name + "', expected F or T");
    }
    return *type;
}

// Fields absent from a piles[] entry keep the value from the "charge" block.
PileConfig parse_pile(const nlohmann::json& pile_json, const PileConfig& defaults) {
    PileConfig pile = defaults;
    pile.id = pile_json.value("id", "");
    if (pile_json.contains("chargeType")) {
        pile.charge_type = parse_charge_type(pile_json.at("chargeType").get<std::string>());
    }
    pile.rated_power_kw = pile_json.value("power", defaults.rated_power_kw);
    const auto size = integer_value(pile_json, "size", static_cast<std::int64_t>(defaults.queue_capacity), "size");
    if (size < 1) {
        throw ConfigurationError("Queue size must be >= 1, got " + std::to_string(size));
    }
    pile.queue_capacity = static_cast<std::size_t>(size);
    pile.allow_interruption = pile_json.value("allowBreak", defaults.allow_interruption);
    pile.enforce_charge_type = pile_json.value("enforceChargeType", defaults.enforce_charge_type);
    if (pile.rated_power_kw <= 0.0) {
        throw ConfigurationError("Pile power must be positive, got " + std::to_string(pile.rated_power_kw));
    }
    if (pile.id.empty()) {
        pile.id = make_pile_id();
    }
    return pile;
}

ClockConfig parse_clock(const nlohmann::json& time_json, std::vector<std::string>& warnings) {
    ClockConfig clock;
    clock.time_zone = time_json.value("tz", clock.time_zone);
    clock.speed_multiplier = integer_value(time_json, "speed", clock.speed_multiplier, "time.speed");
    clock.polling_interval =
        std::chrono::milliseconds(integer_value(time_json, "updateIntervalMs", 5000, "time.updateIntervalMs"));
    if (clock.speed_multiplier < 1) {
        throw ConfigurationError("time.speed must be >= 1, got " + std::to_string(clock.speed_multiplier));
    }
    if (clock.polling_interval.count() <= 0) {
        throw ConfigurationError("time.updateIntervalMs must be positive, got " +
                                 std::to_string(clock.polling_interval.count()));
    }
    const auto* zone = resolve_zone(clock.time_zone);
    const auto start = time_json.value("startTime", "");
    if (!start.empty()) {
        clock.start_instant = parse_instant(start, zone);
    }

    if (clock.polling_interval.count() < 100) {
        warnings.push_back("time.updateIntervalMs is " + std::to_string(clock.polling_interval.count()) +
                           " ms; intervals below 100 ms flood the dispatch service");
    }
    if (clock.speed_multiplier > 1) {
        warnings.push_back("Simulated time runs x" + std::to_string(clock.speed_multiplier) +
                           " faster than real time");
    }
    return clock;
}
} // namespace

PileSimConfig load_pile_sim_config(const fs::path& config_path) {
    if (!fs::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Malformed config " + config_path.string() + ": " + e.what());
    }
    const auto base_dir = config_path.parent_path().empty() ? fs::current_path() : config_path.parent_path();

    PileSimConfig cfg{};
    try {
        const auto price = json.value("price", nlohmann::json::object());
        cfg.price_path = make_absolute(base_dir, price.value("path", "prices.json"));

        const auto charge = json.value("charge", nlohmann::json::object());
        PileConfig defaults;
        defaults.charge_type = parse_charge_type(charge.value("chargeType", "F"));
        defaults.rated_power_kw = charge.value("power", defaults.rated_power_kw);
        const auto size = integer_value(charge, "size", 2, "charge.size");
        if (size < 1) {
            throw ConfigurationError("charge.size must be >= 1, got " + std::to_string(size));
        }
        defaults.queue_capacity = static_cast<std::size_t>(size);
        defaults.allow_interruption = charge.value("allowBreak", false);
        defaults.enforce_charge_type = charge.value("enforceChargeType", false);

        if (json.contains("piles") && json["piles"].is_array() && !json["piles"].empty()) {
            for (const auto& pile_json : json["piles"]) {
                cfg.piles.push_back(parse_pile(pile_json, defaults));
            }
        } else {
            cfg.piles.push_back(parse_pile(charge, defaults));
        }

        std::set<std::string> ids;
        for (const auto& pile : cfg.piles) {
            if (!ids.insert(pile.id).second) {
                throw ConfigurationError("Duplicate pile id '" + pile.id + "'");
            }
        }

        const auto websocket = json.value("websocket", nlohmann::json::object());
        cfg.websocket_url = websocket.value("url", cfg.websocket_url);
        cfg.connect_timeout = std::chrono::seconds(
            integer_value(websocket, "connectTimeoutSeconds", 10, "websocket.connectTimeoutSeconds"));
        if (cfg.connect_timeout.count() <= 0) {
            cfg.connect_timeout = std::chrono::seconds(10);
        }

        cfg.clock = parse_clock(json.value("time", nlohmann::json::object()), cfg.warnings);
        cfg.logging_config = make_absolute(base_dir, json.value("loggingConfig", "logging.ini"));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Invalid config " + config_path.string() + ": " + e.what());
    }
    return cfg;
}

std::string make_pile_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<std::uint64_t> dist;

    std::stringstream ss;
    ss << "pile-" << std::hex << dist(gen);
    return ss.str();
}

} // namespace pilesim
