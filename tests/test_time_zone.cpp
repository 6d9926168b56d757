/**
 * @file test_time_zone.cpp
 * @brief Unit tests for TimeZone and POSIX TZ rules
 *
 * Tests time zone resolution including:
 * - Fixed offsets and zone name validation
 * - POSIX TZ rules in both hemispheres
 * - TZif parsing with transitions and footer rule
 * - System zoneinfo lookup when available
 * - Civil calendar helpers
 */

#include <gtest/gtest.h>
#include "agentauth/time_zone.hpp"
#include "agentauth/errors.hpp"
#include <filesystem>
#include <string>
#include <vector>

using namespace agentauth;

namespace {

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

void put_i64(std::vector<uint8_t>& out, int64_t value) {
    auto bits = static_cast<uint64_t>(value);
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(bits >> shift));
    }
}

void put_header(std::vector<uint8_t>& out, uint32_t timecnt, uint32_t typecnt, uint32_t charcnt) {
    out.insert(out.end(), {'T', 'Z', 'i', 'f', '2'});
    out.insert(out.end(), 15, 0);
    put_u32(out, 0);        // isutcnt
    put_u32(out, 0);        // isstdcnt
    put_u32(out, 0);        // leapcnt
    put_u32(out, timecnt);
    put_u32(out, typecnt);
    put_u32(out, charcnt);
}

void put_type(std::vector<uint8_t>& out, int32_t offset, bool is_dst, uint8_t abbreviation) {
    put_u32(out, static_cast<uint32_t>(offset));
    out.push_back(is_dst ? 1 : 0);
    out.push_back(abbreviation);
}

// US Eastern for 2023 with the rule for later years in the footer
std::vector<uint8_t> make_eastern_tzif() {
    std::vector<uint8_t> data;

    // Minimal v1 block
    put_header(data, 0, 1, 4);
    put_type(data, 0, false, 0);
    data.insert(data.end(), {'U', 'T', 'C', 0});

    // v2 block
    put_header(data, 2, 2, 8);
    put_i64(data, 1678604400);     // 2023-03-12T07:00:00Z
    put_i64(data, 1699164000);     // 2023-11-05T06:00:00Z
    data.push_back(1);
    data.push_back(0);
    put_type(data, -18000, false, 0);
    put_type(data, -14400, true, 4);
    data.insert(data.end(), {'E', 'S', 'T', 0, 'E', 'D', 'T', 0});

    std::string footer = "\nEST5EDT,M3.2.0,M11.1.0\n";
    data.insert(data.end(), footer.begin(), footer.end());
    return data;
}

} // anonymous namespace

// ============================================================================
// Name and Fixed Offset Tests
// ============================================================================

TEST(TimeZoneTest, FixedOffsets) {
    EXPECT_EQ(TimeZone::parse_fixed_offset("UTC"), 0);
    EXPECT_EQ(TimeZone::parse_fixed_offset("Z"), 0);
    EXPECT_EQ(TimeZone::parse_fixed_offset("Etc/UTC"), 0);
    EXPECT_EQ(TimeZone::parse_fixed_offset("+05:30"), 19800);
    EXPECT_EQ(TimeZone::parse_fixed_offset("-08:00"), -28800);
    EXPECT_FALSE(TimeZone::parse_fixed_offset("+5:30").has_value());
    EXPECT_FALSE(TimeZone::parse_fixed_offset("+24:00").has_value());
    EXPECT_FALSE(TimeZone::parse_fixed_offset("America/New_York").has_value());
}

TEST(TimeZoneTest, NameValidation) {
    EXPECT_TRUE(TimeZone::is_valid_name("America/New_York"));
    EXPECT_TRUE(TimeZone::is_valid_name("Etc/GMT+5"));
    EXPECT_TRUE(TimeZone::is_valid_name("America/Port-au-Prince"));
    EXPECT_TRUE(TimeZone::is_valid_name("+05:30"));

    EXPECT_FALSE(TimeZone::is_valid_name(""));
    EXPECT_FALSE(TimeZone::is_valid_name("/etc/passwd"));
    EXPECT_FALSE(TimeZone::is_valid_name("../etc/passwd"));
    EXPECT_FALSE(TimeZone::is_valid_name("America//New_York"));
    EXPECT_FALSE(TimeZone::is_valid_name("America/New York"));
}

TEST(TimeZoneTest, LoadFixedOffsetNeedsNoFiles) {
    auto zone = TimeZone::load("+05:30", "/nonexistent");
    EXPECT_EQ(zone.get_name(), "+05:30");

    // 2023-11-14T22:13:20Z is 03:43 Wednesday in India
    auto local = zone.to_local(1700000000);
    EXPECT_EQ(local.minute_of_day, 3 * 60 + 43);
    EXPECT_EQ(local.weekday, 3);
    EXPECT_EQ(local.day, 15u);
    EXPECT_EQ(local.utc_offset, 19800);
}

TEST(TimeZoneTest, LoadUnknownZoneThrows) {
    try {
        TimeZone::load("Mars/Olympus_Mons", "/nonexistent");
        FAIL() << "expected AgentAuthError";
    } catch (const AgentAuthError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UNKNOWN_TIME_ZONE);
    }

    EXPECT_THROW(TimeZone::load("../../etc/passwd", "/usr/share/zoneinfo"), AgentAuthError);
}

// ============================================================================
// POSIX Rule Tests
// ============================================================================

TEST(TimeZoneTest, PosixRuleWithoutDst) {
    auto rule = PosixTimeZoneRule::parse("UTC0");
    ASSERT_TRUE(rule.has_value());
    EXPECT_FALSE(rule->has_dst);
    EXPECT_EQ(rule->utc_offset_at(1700000000), 0);

    auto quoted = PosixTimeZoneRule::parse("<+0330>-3:30");
    ASSERT_TRUE(quoted.has_value());
    EXPECT_EQ(quoted->std_offset, 12600);
}

TEST(TimeZoneTest, PosixRuleNorthernTransitions) {
    auto rule = PosixTimeZoneRule::parse("EST5EDT,M3.2.0,M11.1.0");
    ASSERT_TRUE(rule.has_value());
    EXPECT_EQ(rule->std_offset, -18000);
    EXPECT_EQ(rule->dst_offset, -14400);

    // 2024-03-10T07:00:00Z and 2024-11-03T06:00:00Z
    EXPECT_EQ(rule->utc_offset_at(1710054000 - 1), -18000);
    EXPECT_EQ(rule->utc_offset_at(1710054000), -14400);
    EXPECT_EQ(rule->utc_offset_at(1730613600 - 1), -14400);
    EXPECT_EQ(rule->utc_offset_at(1730613600), -18000);
}

TEST(TimeZoneTest, PosixRuleSouthernHemisphere) {
    auto rule = PosixTimeZoneRule::parse("AEST-10AEDT,M10.1.0,M4.1.0/3");
    ASSERT_TRUE(rule.has_value());

    EXPECT_EQ(rule->utc_offset_at(1705320000), 39600);  // January
    EXPECT_EQ(rule->utc_offset_at(1719835200), 36000);  // July
}

TEST(TimeZoneTest, PosixRuleRejectsGarbage) {
    EXPECT_FALSE(PosixTimeZoneRule::parse("").has_value());
    EXPECT_FALSE(PosixTimeZoneRule::parse("E5").has_value());
    EXPECT_FALSE(PosixTimeZoneRule::parse("EST").has_value());
    EXPECT_FALSE(PosixTimeZoneRule::parse("EST5EDT,M13.1.0,M11.1.0").has_value());
    EXPECT_FALSE(PosixTimeZoneRule::parse("EST5EDT,M3.2.0").has_value());
}

// ============================================================================
// TZif Tests
// ============================================================================

TEST(TimeZoneTest, TzifTransitionsAndFooter) {
    auto zone = TimeZone::from_tzif("Test/Eastern", make_eastern_tzif());

    EXPECT_EQ(zone.utc_offset(1678604400 - 1), -18000);
    EXPECT_EQ(zone.utc_offset(1678604400), -14400);
    EXPECT_EQ(zone.utc_offset(1699164000 - 1), -14400);

    // Past the last transition the footer rule applies
    EXPECT_EQ(zone.utc_offset(1705320000), -18000);
    EXPECT_EQ(zone.utc_offset(1719835200), -14400);
}

TEST(TimeZoneTest, TzifRejectsCorruptData) {
    EXPECT_THROW(TimeZone::from_tzif("x", {}), AgentAuthError);
    EXPECT_THROW(TimeZone::from_tzif("x", {'T', 'Z', 'i', 'f'}), AgentAuthError);

    auto truncated = make_eastern_tzif();
    truncated.resize(80);
    EXPECT_THROW(TimeZone::from_tzif("x", truncated), AgentAuthError);
}

TEST(TimeZoneTest, SystemZoneinfo) {
    const std::filesystem::path dir = "/usr/share/zoneinfo";
    if (!std::filesystem::exists(dir / "America/New_York")) {
        GTEST_SKIP() << "system zoneinfo not installed";
    }

    auto zone = TimeZone::load("America/New_York", dir);
    auto local = zone.to_local(1700000000);
    EXPECT_EQ(local.utc_offset, -18000);
    EXPECT_EQ(local.minute_of_day, 17 * 60 + 13);
    EXPECT_EQ(local.weekday, 2);
    EXPECT_EQ(zone.utc_offset(1719835200), -14400);
}

// ============================================================================
// Calendar Helper Tests
// ============================================================================

TEST(TimeZoneTest, CivilFromDays) {
    int64_t year;
    unsigned month;
    unsigned day;

    civil_from_days(0, year, month, day);
    EXPECT_EQ(year, 1970);
    EXPECT_EQ(month, 1u);
    EXPECT_EQ(day, 1u);

    civil_from_days(11016, year, month, day);
    EXPECT_EQ(year, 2000);
    EXPECT_EQ(month, 2u);
    EXPECT_EQ(day, 29u);

    civil_from_days(-1, year, month, day);
    EXPECT_EQ(year, 1969);
    EXPECT_EQ(month, 12u);
    EXPECT_EQ(day, 31u);
}

TEST(TimeZoneTest, WeekdayFromDays) {
    EXPECT_EQ(weekday_from_days(0), 4);     // Thursday
    EXPECT_EQ(weekday_from_days(3), 0);     // Sunday
    EXPECT_EQ(weekday_from_days(-1), 3);    // Wednesday
}
