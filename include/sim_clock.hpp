// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <date/tz.h>

namespace pilesim {

/// \brief Simulated instants carry millisecond precision on the system clock epoch (UTC).
using SimTime = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

struct ClockConfig {
    std::string time_zone{"Asia/Shanghai"};
    std::int64_t speed_multiplier{1};
    std::optional<SimTime> start_instant; // unset => real instant at clock construction
    std::chrono::milliseconds polling_interval{5000};
};

/// \brief Accelerated clock shared read-only by every pile.
///
/// now() = start_instant + real_elapsed * speed_multiplier. The polling interval is real time and is not scaled;
/// the multiplier only changes how much simulated time passes between two ticks.
class SimulatedClock {
public:
    using RealTimeSource = std::function<std::chrono::steady_clock::time_point()>;

    /// \throws ConfigurationError for an unknown zone, speed < 1 or a non-positive polling interval.
    explicit SimulatedClock(ClockConfig cfg, RealTimeSource real_source = {});

    SimTime now() const;
    SimTime start_instant() const { return start_; }

    std::chrono::milliseconds polling_interval() const { return cfg_.polling_interval; }
    std::int64_t speed_multiplier() const { return cfg_.speed_multiplier; }
    /// \brief Simulated time that elapses between two consecutive ticks.
    std::chrono::milliseconds simulated_per_tick() const;

    /// \brief Local time-of-day of \p t in the configured zone, as the offset since local midnight.
    std::chrono::milliseconds time_of_day(SimTime t) const;

    /// \brief First instant strictly after \p t whose local time-of-day equals \p offset.
    /// \p offset may be 24h, which names the next local midnight.
    SimTime next_time_of_day(SimTime t, std::chrono::milliseconds offset) const;

    std::string format_local(SimTime t) const;
    const std::string& zone_name() const { return cfg_.time_zone; }
    const date::time_zone* zone() const { return zone_; }

private:
    ClockConfig cfg_;
    RealTimeSource real_source_;
    const date::time_zone* zone_{nullptr};
    std::chrono::steady_clock::time_point real_base_;
    SimTime start_;
};

/// \brief Resolve an IANA zone id. \throws ConfigurationError when the id is unknown.
const date::time_zone* resolve_zone(const std::string& name);

/// \brief Parse an instant. Accepts RFC 3339 with offset or trailing 'Z'; without offset the text is read as
/// local time in \p zone. \throws ConfigurationError when the text matches none of the formats.
SimTime parse_instant(const std::string& text, const date::time_zone* zone);

/// \brief UTC rendering used on the wire, e.g. 2025-06-01T06:30:00.000Z
std::string to_rfc3339(SimTime t);

} // namespace pilesim
