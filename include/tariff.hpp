// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pilesim {

constexpr std::chrono::seconds DAY_LENGTH{24 * 3600};

/// \brief Half-open time-of-day interval [start, end) with a per-kWh price. end < start wraps past midnight.
struct TariffPeriod {
    std::chrono::seconds start{0};
    std::chrono::seconds end{0};
    double price{0.0};
};

/// \brief Immutable time-of-day price table plus a flat per-kWh service fee.
class TariffTable {
public:
    /// \brief Validate that \p periods partition the day and build the lookup segments.
    /// \throws ConfigurationError on gaps, overlaps, more than one wrapping period or negative prices.
    TariffTable(std::vector<TariffPeriod> periods, double service_fee);

    /// \brief Built-in peak/flat/valley table used when no price file exists.
    static TariffTable defaults();

    double price_at(std::chrono::milliseconds time_of_day) const;

    /// \brief Non-wrapping segment containing \p time_of_day. Its end may be DAY_LENGTH.
    const TariffPeriod& period_at(std::chrono::milliseconds time_of_day) const;

    double service_fee() const { return service_fee_; }

    /// \brief Periods as configured (wrapping period kept whole).
    const std::vector<TariffPeriod>& periods() const { return periods_; }

    /// \brief Sorted, non-wrapping segments covering [0, DAY_LENGTH).
    const std::vector<TariffPeriod>& segments() const { return segments_; }

private:
    std::vector<TariffPeriod> periods_;
    std::vector<TariffPeriod> segments_;
    double service_fee_{0.0};
};

/// \brief Parse "HH:MM:SS" (seconds optional). \throws ConfigurationError.
std::chrono::seconds parse_time_of_day(const std::string& text);
std::string format_time_of_day(std::chrono::seconds tod);

TariffTable tariff_from_json(const nlohmann::json& json);
nlohmann::json tariff_to_json(const TariffTable& table);

/// \brief Load the price file at \p path. A missing file is created with the default table.
/// \throws ConfigurationError when the file exists but cannot be parsed or validated.
TariffTable load_tariff(const std::filesystem::path& path);

} // namespace pilesim
