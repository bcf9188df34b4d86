// SPDX-License-Identifier: Apache-2.0
#include "tariff.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <optional>
#include <sstream>
#include <utility>

#include <everest/logging.hpp>

namespace pilesim {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

std::chrono::milliseconds wrap_into_day(std::chrono::milliseconds tod) {
    auto wrapped = tod % std::chrono::milliseconds(DAY_LENGTH);
    if (wrapped < 0ms) {
        wrapped += DAY_LENGTH;
    }
    return wrapped;
}

std::string describe(const TariffPeriod& p) {
    return "[" + format_time_of_day(p.start) + ", " + format_time_of_day(p.end) + ")";
}

} // namespace

TariffTable::TariffTable(std::vector<TariffPeriod> periods, double service_fee) :
    periods_(std::move(periods)), service_fee_(service_fee) {
    if (!std::isfinite(service_fee_) || service_fee_ < 0.0) {
        throw ConfigurationError("Service fee must be a non-negative number");
    }
    if (periods_.empty()) {
        throw ConfigurationError("Price table defines no periods");
    }

    int wrapping = 0;
    for (const auto& p : periods_) {
        if (p.start < 0s || p.start >= DAY_LENGTH || p.end < 0s || p.end > DAY_LENGTH) {
            throw ConfigurationError("Price period " + describe(p) + " is outside the day");
        }
        if (!std::isfinite(p.price) || p.price < 0.0) {
            throw ConfigurationError("Price period " + describe(p) + " has an invalid price");
        }
        if (p.end <= p.start) {
            // start == end wraps all the way round and covers the whole day
            ++wrapping;
            segments_.push_back(TariffPeriod{p.start, DAY_LENGTH, p.price});
            if (p.end > 0s) {
                segments_.push_back(TariffPeriod{0s, p.end, p.price});
            }
        } else {
            segments_.push_back(p);
        }
    }
    if (wrapping > 1) {
        throw ConfigurationError(std::to_string(wrapping) + " price periods cross midnight; at most one may");
    }

    std::sort(segments_.begin(), segments_.end(),
              [](const TariffPeriod& a, const TariffPeriod& b) { return a.start < b.start; });

    if (segments_.front().start != 0s) {
        throw ConfigurationError("Price table leaves [00:00:00, " + format_time_of_day(segments_.front().start) +
                                 ") uncovered");
    }
    for (std::size_t i = 1; i < segments_.size(); ++i) {
        const auto& prev = segments_[i - 1];
        const auto& cur = segments_[i];
        if (cur.start < prev.end) {
            throw ConfigurationError("Price periods " + describe(prev) + " and " + describe(cur) + " overlap");
        }
        if (cur.start > prev.end) {
            throw ConfigurationError("Price table leaves [" + format_time_of_day(prev.end) + ", " +
                                     format_time_of_day(cur.start) + ") uncovered");
        }
    }
    if (segments_.back().end != DAY_LENGTH) {
        throw ConfigurationError("Price table leaves [" + format_time_of_day(segments_.back().end) +
                                 ", 24:00:00) uncovered");
    }
}

TariffTable TariffTable::defaults() {
    using std::chrono::hours;
    return TariffTable(
        {
            TariffPeriod{hours(0), hours(7), 0.4},   // valley
            TariffPeriod{hours(7), hours(10), 0.7},  // flat
            TariffPeriod{hours(10), hours(15), 1.0}, // peak
            TariffPeriod{hours(15), hours(18), 0.7}, // flat
            TariffPeriod{hours(18), hours(21), 1.0}, // peak
            TariffPeriod{hours(21), hours(23), 0.7}, // flat
            TariffPeriod{hours(23), hours(0), 0.4},  // valley
        },
        0.8);
}

const TariffPeriod& TariffTable::period_at(std::chrono::milliseconds time_of_day) const {
    const auto tod = wrap_into_day(time_of_day);
    auto it = std::upper_bound(segments_.begin(), segments_.end(), tod,
                               [](std::chrono::milliseconds value, const TariffPeriod& seg) {
                                   return value < seg.start;
                               });
    return *std::prev(it);
}

double TariffTable::price_at(std::chrono::milliseconds time_of_day) const {
    return period_at(time_of_day).price;
}

std::chrono::seconds parse_time_of_day(const std::string& text) {
    int h = -1;
    int m = -1;
    int s = 0;
    int consumed = 0;
    bool ok = std::sscanf(text.c_str(), "%d:%d:%d%n", &h, &m, &s, &consumed) == 3 &&
              consumed == static_cast<int>(text.size());
    if (!ok) {
        s = 0;
        consumed = 0;
        ok = std::sscanf(text.c_str(), "%d:%d%n", &h, &m, &consumed) == 2 &&
             consumed == static_cast<int>(text.size());
    }
    const bool end_of_day = ok && h == 24 && m == 0 && s == 0;
    if (!ok || ((h < 0 || h > 23) && !end_of_day) || m < 0 || m > 59 || s < 0 || s > 59) {
        throw ConfigurationError("Malformed time of day '" + text + "', expected HH:MM:SS");
    }
    return std::chrono::hours(h) + std::chrono::minutes(m) + std::chrono::seconds(s);
}

std::string format_time_of_day(std::chrono::seconds tod) {
    const auto total = tod.count();
    std::ostringstream os;
    os << std::setfill('0') << std::setw(2) << total / 3600 << ':' << std::setw(2) << (total / 60) % 60 << ':'
       << std::setw(2) << total % 60;
    return os.str();
}

TariffTable tariff_from_json(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("periods") || !json["periods"].is_array()) {
        throw ConfigurationError("Price file must contain a 'periods' array");
    }
    std::vector<TariffPeriod> periods;
    for (const auto& entry : json["periods"]) {
        if (!entry.is_object() || !entry.contains("start") || !entry.contains("end") || !entry.contains("price")) {
            throw ConfigurationError("Price period needs 'start', 'end' and 'price': " + entry.dump());
        }
        if (!entry["start"].is_string() || !entry["end"].is_string() || !entry["price"].is_number()) {
            throw ConfigurationError("Price period has wrongly typed fields: " + entry.dump());
        }
        TariffPeriod period;
        period.start = parse_time_of_day(entry["start"].get<std::string>());
        period.end = parse_time_of_day(entry["end"].get<std::string>());
        period.price = entry["price"].get<double>();
        periods.push_back(period);
    }
    const auto fee = json.value("service_fee", 0.0);
    return TariffTable(std::move(periods), fee);
}

nlohmann::json tariff_to_json(const TariffTable& table) {
    nlohmann::json root;
    root["periods"] = nlohmann::json::array();
    for (const auto& p : table.periods()) {
        nlohmann::json entry;
        entry["start"] = format_time_of_day(p.start);
        entry["end"] = format_time_of_day(p.end == DAY_LENGTH ? 0s : p.end);
        entry["price"] = p.price;
        root["periods"].push_back(entry);
    }
    root["service_fee"] = table.service_fee();
    return root;
}

TariffTable load_tariff(const fs::path& path) {
    if (!fs::exists(path)) {
        EVLOG_warning << "Price file " << path.string() << " not found, writing the default price table";
        auto table = TariffTable::defaults();
        std::error_code ec;
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path(), ec);
        }
        std::ofstream out(path);
        if (out) {
            out << tariff_to_json(table).dump(2);
            EVLOG_info << "Default prices written to " << path.string();
        } else {
            EVLOG_error << "Unable to write default prices to " << path.string();
        }
        return table;
    }

    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("Unable to read price file " + path.string());
    }
    std::optional<TariffTable> loaded;
    try {
        loaded.emplace(tariff_from_json(nlohmann::json::parse(in)));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Price file " + path.string() + " is not valid: " + e.what());
    }
    auto table = std::move(*loaded);
    EVLOG_info << "Loaded " << table.periods().size() << " price periods from " << path.string()
               << ", service fee " << table.service_fee();
    return table;
}

} // namespace pilesim
