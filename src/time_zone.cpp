/**
 * @file time_zone.cpp
 * @brief Implementation of TZif and POSIX TZ time zone resolution
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentauth/time_zone.hpp"
#include "agentauth/config.hpp"
#include "agentauth/errors.hpp"
#include "agentauth/utilities.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace agentauth {

namespace {

constexpr int64_t SECONDS_PER_DAY = 86400;

// TZif header: magic(4) version(1) reserved(15) six 32-bit counts
constexpr size_t TZIF_HEADER_SIZE = 44;

bool is_leap_year(int64_t year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int64_t year, unsigned month) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return days[month - 1];
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

// ============================================================================
// Big-endian reader
// ============================================================================

class TzifReader {
public:
    TzifReader(const std::vector<uint8_t>& data, size_t offset)
        : data_(data), pos_(offset) {}

    bool has(size_t count) const { return pos_ + count <= data_.size(); }

    uint8_t read_u8() { return data_[pos_++]; }

    uint32_t read_u32() {
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | data_[pos_++];
        }
        return value;
    }

    int64_t read_i64() {
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | data_[pos_++];
        }
        return static_cast<int64_t>(value);
    }

    void skip(size_t count) { pos_ += count; }

    size_t position() const { return pos_; }

private:
    const std::vector<uint8_t>& data_;
    size_t pos_;
};

struct TzifCounts {
    uint32_t isutcnt;
    uint32_t isstdcnt;
    uint32_t leapcnt;
    uint32_t timecnt;
    uint32_t typecnt;
    uint32_t charcnt;
};

std::optional<TzifCounts> read_header(TzifReader& reader, char& version) {
    if (!reader.has(TZIF_HEADER_SIZE)) {
        return std::nullopt;
    }
    if (reader.read_u8() != 'T' || reader.read_u8() != 'Z' ||
        reader.read_u8() != 'i' || reader.read_u8() != 'f') {
        return std::nullopt;
    }
    version = static_cast<char>(reader.read_u8());
    reader.skip(15);

    TzifCounts counts;
    counts.isutcnt = reader.read_u32();
    counts.isstdcnt = reader.read_u32();
    counts.leapcnt = reader.read_u32();
    counts.timecnt = reader.read_u32();
    counts.typecnt = reader.read_u32();
    counts.charcnt = reader.read_u32();

    if (counts.typecnt == 0) {
        return std::nullopt;
    }
    return counts;
}

size_t data_block_size(const TzifCounts& counts, size_t time_size) {
    return static_cast<size_t>(counts.timecnt) * time_size +
           counts.timecnt +
           static_cast<size_t>(counts.typecnt) * 6 +
           counts.charcnt +
           static_cast<size_t>(counts.leapcnt) * (time_size + 4) +
           counts.isstdcnt +
           counts.isutcnt;
}

// ============================================================================
// POSIX TZ string parsing
// ============================================================================

class PosixParser {
public:
    explicit PosixParser(const std::string& text) : text_(text), pos_(0) {}

    bool at_end() const { return pos_ >= text_.length(); }

    char peek() const { return at_end() ? '\0' : text_[pos_]; }

    bool consume(char c) {
        if (peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    // "EST" or "<+0330>"
    bool parse_name() {
        if (consume('<')) {
            size_t close = text_.find('>', pos_);
            if (close == std::string::npos || close - pos_ < 3) {
                return false;
            }
            pos_ = close + 1;
            return true;
        }
        size_t start = pos_;
        while (!at_end() && std::isalpha(static_cast<unsigned char>(peek()))) {
            ++pos_;
        }
        return pos_ - start >= 3;
    }

    bool parse_number(int& value, int max_digits) {
        size_t start = pos_;
        value = 0;
        while (!at_end() && std::isdigit(static_cast<unsigned char>(peek())) &&
               static_cast<int>(pos_ - start) < max_digits) {
            value = value * 10 + (peek() - '0');
            ++pos_;
        }
        return pos_ > start;
    }

    // [+|-]hh[:mm[:ss]]
    bool parse_hms(int& seconds, int max_hours) {
        int sign = 1;
        if (consume('-')) {
            sign = -1;
        } else {
            consume('+');
        }

        int hours = 0;
        int minutes = 0;
        int secs = 0;
        if (!parse_number(hours, 3) || hours > max_hours) {
            return false;
        }
        if (consume(':')) {
            if (!parse_number(minutes, 2) || minutes > 59) {
                return false;
            }
            if (consume(':')) {
                if (!parse_number(secs, 2) || secs > 59) {
                    return false;
                }
            }
        }
        seconds = sign * (hours * 3600 + minutes * 60 + secs);
        return true;
    }

    bool parse_date(PosixTimeZoneRule::Date& date) {
        using Kind = PosixTimeZoneRule::Date::Kind;

        if (consume('J')) {
            date.kind = Kind::JULIAN_NO_LEAP;
            if (!parse_number(date.day, 3) || date.day < 1 || date.day > 365) {
                return false;
            }
        } else if (consume('M')) {
            date.kind = Kind::MONTH_WEEK_DAY;
            if (!parse_number(date.month, 2) || date.month < 1 || date.month > 12 ||
                !consume('.') ||
                !parse_number(date.week, 1) || date.week < 1 || date.week > 5 ||
                !consume('.') ||
                !parse_number(date.day, 1) || date.day > 6) {
                return false;
            }
        } else {
            date.kind = Kind::ZERO_BASED;
            if (!parse_number(date.day, 3) || date.day > 365) {
                return false;
            }
        }

        date.time = 7200;
        if (consume('/')) {
            // RFC 8536 extension: -167..167 hours
            if (!parse_hms(date.time, 167)) {
                return false;
            }
        }
        return true;
    }

private:
    const std::string& text_;
    size_t pos_;
};

// Seconds since epoch of local midnight starting the rule's day in year
int64_t rule_day_start(const PosixTimeZoneRule::Date& date, int64_t year) {
    using Kind = PosixTimeZoneRule::Date::Kind;

    int64_t jan1 = utilities::days_from_civil(year, 1, 1);
    int64_t days = 0;

    switch (date.kind) {
        case Kind::JULIAN_NO_LEAP:
            days = jan1 + date.day - 1;
            if (is_leap_year(year) && date.day >= 60) {
                ++days;
            }
            break;

        case Kind::ZERO_BASED:
            days = jan1 + date.day;
            break;

        case Kind::MONTH_WEEK_DAY: {
            unsigned month = static_cast<unsigned>(date.month);
            int64_t first = utilities::days_from_civil(year, month, 1);
            int first_weekday = weekday_from_days(first);
            int64_t day_of_month = 1 + (date.day - first_weekday + 7) % 7 + (date.week - 1) * 7;
            while (day_of_month > days_in_month(year, month)) {
                day_of_month -= 7;
            }
            days = first + day_of_month - 1;
            break;
        }
    }

    return days * SECONDS_PER_DAY;
}

} // anonymous namespace

// ============================================================================
// Calendar helpers
// ============================================================================

void civil_from_days(int64_t days, int64_t& year, unsigned& month, unsigned& day) {
    // Howard Hinnant's civil_from_days
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0);
}

int weekday_from_days(int64_t days) {
    // 1970-01-01 was a Thursday
    int64_t weekday = (days + 4) % 7;
    if (weekday < 0) {
        weekday += 7;
    }
    return static_cast<int>(weekday);
}

// ============================================================================
// PosixTimeZoneRule
// ============================================================================

std::optional<PosixTimeZoneRule> PosixTimeZoneRule::parse(const std::string& text) {
    PosixParser parser(text);
    PosixTimeZoneRule rule;

    // POSIX offsets are positive west of Greenwich
    int std_west = 0;
    if (!parser.parse_name() || !parser.parse_hms(std_west, 24)) {
        return std::nullopt;
    }
    rule.std_offset = -std_west;

    if (parser.at_end()) {
        return rule;
    }

    if (!parser.parse_name()) {
        return std::nullopt;
    }
    rule.has_dst = true;
    rule.dst_offset = rule.std_offset + 3600;

    if (parser.peek() != ',' && !parser.at_end()) {
        int dst_west = 0;
        if (!parser.parse_hms(dst_west, 24)) {
            return std::nullopt;
        }
        rule.dst_offset = -dst_west;
    }

    if (parser.at_end()) {
        // POSIX default rule is implementation-defined; use the US rule
        rule.dst_start = Date{Date::Kind::MONTH_WEEK_DAY, 0, 2, 3, 7200};
        rule.dst_end = Date{Date::Kind::MONTH_WEEK_DAY, 0, 1, 11, 7200};
        return rule;
    }

    if (!parser.consume(',') || !parser.parse_date(rule.dst_start) ||
        !parser.consume(',') || !parser.parse_date(rule.dst_end) ||
        !parser.at_end()) {
        return std::nullopt;
    }

    return rule;
}

int PosixTimeZoneRule::utc_offset_at(int64_t unix_time) const {
    if (!has_dst) {
        return std_offset;
    }

    int64_t year;
    unsigned month;
    unsigned day;
    civil_from_days(floor_div(unix_time + std_offset, SECONDS_PER_DAY), year, month, day);

    // Start is expressed in standard time, end in daylight time
    int64_t start = rule_day_start(dst_start, year) + dst_start.time - std_offset;
    int64_t end = rule_day_start(dst_end, year) + dst_end.time - dst_offset;

    bool in_dst;
    if (start < end) {
        in_dst = unix_time >= start && unix_time < end;
    } else {
        // Southern hemisphere: DST spans the new year
        in_dst = unix_time < end || unix_time >= start;
    }

    return in_dst ? dst_offset : std_offset;
}

// ============================================================================
// TimeZone construction
// ============================================================================

TimeZone::TimeZone(std::string name)
    : name_(std::move(name))
{
}

TimeZone TimeZone::utc() {
    TimeZone zone("UTC");
    zone.types_.push_back(LocalTimeType{0, false});
    return zone;
}

std::optional<int> TimeZone::parse_fixed_offset(const std::string& name) {
    if (name == "UTC" || name == "Z" || name == "GMT" || name == "Etc/UTC") {
        return 0;
    }

    // [+|-]HH:MM
    if (name.length() != 6 || (name[0] != '+' && name[0] != '-') || name[3] != ':') {
        return std::nullopt;
    }
    for (size_t i : {1, 2, 4, 5}) {
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) {
            return std::nullopt;
        }
    }

    int hours = (name[1] - '0') * 10 + (name[2] - '0');
    int minutes = (name[4] - '0') * 10 + (name[5] - '0');
    if (hours > 23 || minutes > 59) {
        return std::nullopt;
    }

    int offset = hours * 3600 + minutes * 60;
    return name[0] == '-' ? -offset : offset;
}

bool TimeZone::is_valid_name(const std::string& name) {
    if (parse_fixed_offset(name)) {
        return true;
    }
    if (name.empty() || name.length() > 255 || name[0] == '/') {
        return false;
    }

    for (char c : name) {
        bool allowed = std::isalnum(static_cast<unsigned char>(c)) ||
                       c == '/' || c == '_' || c == '-' || c == '+' || c == '.';
        if (!allowed) {
            return false;
        }
    }

    for (const auto& component : utilities::split_string(name, '/')) {
        if (component.empty() || component == "." || component == "..") {
            return false;
        }
    }
    return true;
}

TimeZone TimeZone::load(const std::string& name) {
    return load(name, config::get_zoneinfo_directory());
}

TimeZone TimeZone::load(const std::string& name, const std::filesystem::path& zoneinfo_dir) {
    if (!is_valid_name(name)) {
        throw AgentAuthError(ErrorCode::UNKNOWN_TIME_ZONE, "invalid time zone name: " + name);
    }

    auto fixed = parse_fixed_offset(name);
    if (fixed) {
        TimeZone zone(name);
        zone.types_.push_back(LocalTimeType{static_cast<int32_t>(*fixed), false});
        return zone;
    }

    auto path = zoneinfo_dir / name;
    auto data = utilities::read_file_binary(path.string());
    if (!data) {
        throw AgentAuthError(ErrorCode::UNKNOWN_TIME_ZONE, "no zoneinfo for " + name);
    }

    return from_tzif(name, *data);
}

TimeZone TimeZone::from_tzif(const std::string& name, const std::vector<uint8_t>& data) {
    TzifReader reader(data, 0);
    char version = '\0';

    auto counts = read_header(reader, version);
    if (!counts) {
        throw AgentAuthError(ErrorCode::UNKNOWN_TIME_ZONE, "not a TZif file: " + name);
    }

    size_t time_size = 4;
    if (version >= '2') {
        // Skip the 32-bit block and read the 64-bit one that follows
        size_t v1_size = data_block_size(*counts, 4);
        if (!reader.has(v1_size)) {
            throw AgentAuthError(ErrorCode::UNKNOWN_TIME_ZONE, "truncated TZif file: " + name);
        }
        reader.skip(v1_size);
        counts = read_header(reader, version);
        if (!counts) {
            throw AgentAuthError(ErrorCode::UNKNOWN_TIME_ZONE, "corrupt TZif v2 header: " + name);
        }
        time_size = 8;
    }

    if (!reader.has(data_block_size(*counts, time_size))) {
        throw AgentAuthError(ErrorCode::UNKNOWN_TIME_ZONE, "truncated TZif file: " + name);
    }

    TimeZone zone(name);

    std::vector<int64_t> times(counts->timecnt);
    for (auto& at : times) {
        at = time_size == 8 ? reader.read_i64()
                            : static_cast<int64_t>(static_cast<int32_t>(reader.read_u32()));
    }

    for (uint32_t i = 0; i < counts->timecnt; ++i) {
        size_t type_index = reader.read_u8();
        if (type_index >= counts->typecnt) {
            throw AgentAuthError(ErrorCode::UNKNOWN_TIME_ZONE, "corrupt TZif transition: " + name);
        }
        zone.transitions_.push_back(Transition{times[i], type_index});
    }

    for (uint32_t i = 0; i < counts->typecnt; ++i) {
        int32_t utc_offset = static_cast<int32_t>(reader.read_u32());
        bool is_dst = reader.read_u8() != 0;
        reader.skip(1);  // abbreviation index
        zone.types_.push_back(LocalTimeType{utc_offset, is_dst});
    }

    reader.skip(counts->charcnt);
    reader.skip(static_cast<size_t>(counts->leapcnt) * (time_size + 4));
    reader.skip(counts->isstdcnt);
    reader.skip(counts->isutcnt);

    // v2+ footer: "\n<POSIX TZ>\n"
    if (time_size == 8 && reader.has(1) && reader.read_u8() == '\n') {
        size_t start = reader.position();
        size_t end = start;
        while (end < data.size() && data[end] != '\n') {
            ++end;
        }
        if (end < data.size() && end > start) {
            std::string footer(data.begin() + static_cast<std::ptrdiff_t>(start),
                               data.begin() + static_cast<std::ptrdiff_t>(end));
            zone.footer_ = PosixTimeZoneRule::parse(footer);
            if (!zone.footer_) {
                utilities::log_warn("TimeZone: Ignoring unparsable footer '" + footer + "' in " + name);
            }
        }
    }

    return zone;
}

// ============================================================================
// Conversion
// ============================================================================

int TimeZone::utc_offset(int64_t unix_time) const {
    if (transitions_.empty()) {
        if (footer_) {
            return footer_->utc_offset_at(unix_time);
        }
        return types_.front().utc_offset;
    }

    if (unix_time < transitions_.front().at) {
        return types_.front().utc_offset;
    }

    if (unix_time >= transitions_.back().at && footer_) {
        return footer_->utc_offset_at(unix_time);
    }

    auto it = std::upper_bound(
        transitions_.begin(), transitions_.end(), unix_time,
        [](int64_t t, const Transition& transition) { return t < transition.at; }
    );
    --it;
    return types_[it->type_index].utc_offset;
}

LocalTime TimeZone::to_local(int64_t unix_time) const {
    LocalTime local;
    local.utc_offset = utc_offset(unix_time);

    int64_t local_seconds = unix_time + local.utc_offset;
    int64_t days = floor_div(local_seconds, SECONDS_PER_DAY);
    int64_t seconds_of_day = local_seconds - days * SECONDS_PER_DAY;

    civil_from_days(days, local.year, local.month, local.day);
    local.weekday = weekday_from_days(days);
    local.minute_of_day = static_cast<int>(seconds_of_day / 60);
    return local;
}

} // namespace agentauth
