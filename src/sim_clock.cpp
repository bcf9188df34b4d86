// SPDX-License-Identifier: Apache-2.0
#include "sim_clock.hpp"
#include "errors.hpp"

#include <initializer_list>
#include <sstream>
#include <utility>

#include <date/date.h>
#include <everest/logging.hpp>

namespace pilesim {

namespace {

template <typename Duration> SimTime to_sim(date::sys_time<Duration> tp) {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
}

bool fully_consumed(std::istringstream& in) {
    if (in.fail()) {
        return false;
    }
    in >> std::ws;
    return in.eof();
}

} // namespace

SimulatedClock::SimulatedClock(ClockConfig cfg, RealTimeSource real_source) :
    cfg_(std::move(cfg)), real_source_(std::move(real_source)) {
    if (cfg_.speed_multiplier < 1) {
        throw ConfigurationError("Time speed multiplier must be >= 1, got " + std::to_string(cfg_.speed_multiplier));
    }
    if (cfg_.polling_interval.count() <= 0) {
        throw ConfigurationError("Polling interval must be positive, got " +
                                 std::to_string(cfg_.polling_interval.count()) + " ms");
    }
    zone_ = resolve_zone(cfg_.time_zone);
    if (!real_source_) {
        real_source_ = []() { return std::chrono::steady_clock::now(); };
    }
    real_base_ = real_source_();
    start_ = cfg_.start_instant.value_or(std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now()));
    EVLOG_debug << "Simulated clock starts at " << format_local(start_) << " speed x" << cfg_.speed_multiplier
                << " tick " << cfg_.polling_interval.count() << " ms";
}

SimTime SimulatedClock::now() const {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(real_source_() - real_base_);
    return start_ + elapsed * cfg_.speed_multiplier;
}

std::chrono::milliseconds SimulatedClock::simulated_per_tick() const {
    return cfg_.polling_interval * cfg_.speed_multiplier;
}

std::chrono::milliseconds SimulatedClock::time_of_day(SimTime t) const {
    const auto local = zone_->to_local(t);
    return std::chrono::duration_cast<std::chrono::milliseconds>(local - date::floor<date::days>(local));
}

SimTime SimulatedClock::next_time_of_day(SimTime t, std::chrono::milliseconds offset) const {
    const auto local = zone_->to_local(t);
    auto candidate = date::floor<date::days>(local) + offset;
    // Repeated local hours (DST fall-back) can map the candidate before t, so try both mappings.
    for (;;) {
        if (candidate > local) {
            const auto earliest = to_sim(zone_->to_sys(candidate, date::choose::earliest));
            if (earliest > t) {
                return earliest;
            }
            const auto latest = to_sim(zone_->to_sys(candidate, date::choose::latest));
            if (latest > t) {
                return latest;
            }
        }
        candidate += date::days{1};
    }
}

std::string SimulatedClock::format_local(SimTime t) const {
    return date::format("%F %T %Z", date::make_zoned(zone_, t));
}

const date::time_zone* resolve_zone(const std::string& name) {
    try {
        return date::locate_zone(name);
    } catch (const std::exception& e) {
        throw ConfigurationError("Unsupported time zone '" + name + "': " + e.what());
    }
}

SimTime parse_instant(const std::string& text, const date::time_zone* zone) {
    for (const char* fmt : {"%FT%T%Ez", "%F %T%Ez"}) {
        std::istringstream in{text};
        date::sys_time<std::chrono::milliseconds> tp;
        in >> date::parse(fmt, tp);
        if (fully_consumed(in)) {
            return tp;
        }
    }
    if (!text.empty() && (text.back() == 'Z' || text.back() == 'z')) {
        std::istringstream in{text.substr(0, text.size() - 1)};
        date::sys_time<std::chrono::milliseconds> tp;
        in >> date::parse("%FT%T", tp);
        if (fully_consumed(in)) {
            return tp;
        }
    }
    if (zone != nullptr) {
        for (const char* fmt : {"%FT%T", "%F %T"}) {
            std::istringstream in{text};
            date::local_time<std::chrono::milliseconds> lt;
            in >> date::parse(fmt, lt);
            if (fully_consumed(in)) {
                return to_sim(zone->to_sys(lt, date::choose::earliest));
            }
        }
    }
    throw ConfigurationError("Malformed instant '" + text + "'");
}

std::string to_rfc3339(SimTime t) {
    return date::format("%FT%TZ", t);
}

} // namespace pilesim
