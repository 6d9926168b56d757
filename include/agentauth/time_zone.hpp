/**
 * @file time_zone.hpp
 * @brief IANA time zone resolution from the system zoneinfo database
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - TZif v1/v2/v3 reader (RFC 8536)
 * - POSIX TZ footer rules for instants after the last transition
 * - "UTC", "Z", "GMT" and fixed "+HH:MM" / "-HH:MM" offsets without lookup
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agentauth {

/**
 * @brief Broken-down local time
 */
struct LocalTime {
    int64_t year;
    unsigned month;         ///< 1-12
    unsigned day;           ///< 1-31
    int weekday;            ///< 0 = Sunday
    int minute_of_day;      ///< 0-1439
    int utc_offset;         ///< Seconds east of UTC
};

/**
 * @brief Rule from a POSIX TZ string ("EST5EDT,M3.2.0,M11.1.0")
 */
struct PosixTimeZoneRule {
    /**
     * @brief Transition date rule
     */
    struct Date {
        enum class Kind { JULIAN_NO_LEAP, ZERO_BASED, MONTH_WEEK_DAY };
        Kind kind = Kind::MONTH_WEEK_DAY;
        int day = 0;            ///< Jn: 1-365, n: 0-365, Mm.w.d: weekday 0-6
        int week = 0;           ///< Mm.w.d only, 5 = last
        int month = 0;          ///< Mm.w.d only
        int time = 7200;        ///< Seconds after local midnight, may be negative
    };

    int std_offset = 0;         ///< Seconds east of UTC
    bool has_dst = false;
    int dst_offset = 0;
    Date dst_start;
    Date dst_end;

    /**
     * @brief Parse a POSIX TZ string
     * @return Rule or std::nullopt if unparsable
     */
    static std::optional<PosixTimeZoneRule> parse(const std::string& text);

    /**
     * @brief UTC offset in effect at unix_time
     */
    int utc_offset_at(int64_t unix_time) const;
};

/**
 * @brief TimeZone - Maps UTC instants to local time
 *
 * Immutable once loaded; safe to share across threads.
 */
class TimeZone {
public:
    /**
     * @brief The UTC zone
     */
    static TimeZone utc();

    /**
     * @brief Load a zone by IANA name
     *
     * Fixed zones ("UTC", "Z", "GMT", "+05:30") need no database.
     *
     * @param name Zone name, e.g. "America/New_York"
     * @param zoneinfo_dir Root of the TZif database
     * @throws AgentAuthError(UNKNOWN_TIME_ZONE) if the name is invalid or
     *         no readable TZif file exists for it
     */
    static TimeZone load(
        const std::string& name,
        const std::filesystem::path& zoneinfo_dir
    );

    /**
     * @brief Load from the configured zoneinfo directory
     */
    static TimeZone load(const std::string& name);

    /**
     * @brief Parse TZif file contents
     * @throws AgentAuthError(UNKNOWN_TIME_ZONE) if the data is not TZif
     */
    static TimeZone from_tzif(const std::string& name, const std::vector<uint8_t>& data);

    /**
     * @brief Check that a name is safe to resolve under the database root
     *
     * Rejects empty names, absolute paths and ".." components.
     */
    static bool is_valid_name(const std::string& name);

    /**
     * @brief Parse a fixed offset zone name
     * @return Seconds east of UTC or std::nullopt if name is not a fixed zone
     */
    static std::optional<int> parse_fixed_offset(const std::string& name);

    const std::string& get_name() const { return name_; }

    /**
     * @brief Offset from UTC (seconds east) at unix_time
     */
    int utc_offset(int64_t unix_time) const;

    /**
     * @brief Convert unix_time to local calendar time
     */
    LocalTime to_local(int64_t unix_time) const;

private:
    struct Transition {
        int64_t at;
        size_t type_index;
    };

    struct LocalTimeType {
        int32_t utc_offset;
        bool is_dst;
    };

    explicit TimeZone(std::string name);

    std::string name_;
    std::vector<Transition> transitions_;
    std::vector<LocalTimeType> types_;
    std::optional<PosixTimeZoneRule> footer_;
};

/**
 * @brief Civil date from days since 1970-01-01
 */
void civil_from_days(int64_t days, int64_t& year, unsigned& month, unsigned& day);

/**
 * @brief Weekday (0 = Sunday) of days since 1970-01-01
 */
int weekday_from_days(int64_t days);

} // namespace agentauth
