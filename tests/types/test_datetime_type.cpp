#include "../test_helpers.hpp"
#include <chrono>

using namespace ModelFusion;
using namespace TestHelpers;

// ============================================================================
// Test: DateTime::parse
// ============================================================================

// Test: date-only input is midnight
bool test_parse_date_only() {
    auto dt = DateTime::parse("2013-08-21");
    return dt && dt->year == 2013 && dt->month == 8 && dt->day == 21
        && dt->hour == 0 && dt->minute == 0 && dt->second == 0 && !dt->utcOffsetMinutes;
}

// Test: full timestamp with microseconds
bool test_parse_microseconds() {
    auto dt = DateTime::parse("2013-08-21T13:04:19.123456");
    return dt && dt->hour == 13 && dt->minute == 4 && dt->second == 19 && dt->microsecond == 123456;
}

// Test: short fractions are scaled, long ones truncated
bool test_parse_fraction_scaling() {
    auto a = DateTime::parse("2013-08-21T13:04:19.5");
    auto b = DateTime::parse("2013-08-21T13:04:19.123456789");
    return a && a->microsecond == 500000
        && b && b->microsecond == 123456;
}

// Test: space separator and minutes-only time
bool test_parse_space_separator() {
    auto dt = DateTime::parse("2013-08-21 13:04");
    return dt && dt->hour == 13 && dt->minute == 4 && dt->second == 0;
}

// Test: UTC designator and numeric offsets
bool test_parse_offsets() {
    auto z  = DateTime::parse("2013-08-21T13:04:19Z");
    auto p  = DateTime::parse("2013-08-21T13:04:19+05:30");
    auto n  = DateTime::parse("2013-08-21T13:04:19-0200");
    return z && z->utcOffsetMinutes == 0
        && p && p->utcOffsetMinutes == 330
        && n && n->utcOffsetMinutes == -120;
}

// Test: malformed and out-of-range input is rejected
bool test_parse_rejects() {
    return !DateTime::parse("")
        && !DateTime::parse("2013-8-21")
        && !DateTime::parse("2013-02-29")
        && !DateTime::parse("2013-13-01")
        && !DateTime::parse("2013-08-21T25:00")
        && !DateTime::parse("2013-08-21T13:04:19.")
        && !DateTime::parse("2013-08-21T13:04:19+5")
        && !DateTime::parse("2013-08-21X13:04")
        && !DateTime::parse("2013-08-21T13:04:19 trailing");
}

// Test: leap day is accepted in leap years
bool test_parse_leap_day() {
    return DateTime::parse("2012-02-29").has_value()
        && DateTime::parse("2000-02-29").has_value()
        && !DateTime::parse("1900-02-29").has_value();
}

// Test: offset-carrying timestamps compare as instants
bool test_aware_equality() {
    auto plusOne = DateTime::parse("2013-08-21T10:00:00+01:00");
    auto utc     = DateTime::parse("2013-08-21T09:00:00Z");
    auto later   = DateTime::parse("2013-08-21T10:00:00Z");
    auto naive   = DateTime::parse("2013-08-21T09:00:00");
    return plusOne && utc && later && naive
        && *plusOne == *utc
        && *plusOne != *later
        && *utc != *naive
        && Value(*plusOne) == Value(*utc);
}

// ============================================================================
// Test: DateTime rendering
// ============================================================================

// Test: fraction appears only when non-zero
bool test_iso_rendering() {
    DateTime a{.year = 2013, .month = 8, .day = 21, .hour = 13, .minute = 4, .second = 19};
    DateTime b = a;
    b.microsecond = 1200;
    return a.toIsoString() == "2013-08-21T13:04:19"
        && b.toIsoString() == "2013-08-21T13:04:19.001200";
}

// Test: offsets render as +HH:MM
bool test_iso_offset_rendering() {
    auto z = DateTime::parse("2013-08-21T13:04:19Z");
    auto n = DateTime::parse("2013-08-21T13:04:19-02:30");
    return z && z->toIsoString() == "2013-08-21T13:04:19+00:00"
        && n && n->toIsoString() == "2013-08-21T13:04:19-02:30";
}

// Test: ISO rendering parses back to the same value at microsecond precision
bool test_iso_round_trip() {
    DateTime now = DateTime::now();
    auto back = DateTime::parse(now.toIsoString());
    return back && *back == now;
}

// Test: time_point bridge
bool test_time_point_bridge() {
    using namespace std::chrono;
    const sys_days day = 2013y / August / 21d;
    const auto tp = day + hours{13} + minutes{4} + seconds{19} + microseconds{250};
    DateTime dt = DateTime::fromTimePoint(time_point_cast<system_clock::duration>(tp));
    return dt.year == 2013 && dt.month == 8 && dt.day == 21
        && dt.hour == 13 && dt.minute == 4 && dt.second == 19 && dt.microsecond == 250
        && dt.toTimePoint() == time_point_cast<system_clock::duration>(tp);
}

// ============================================================================
// Test: DateTimeType
// ============================================================================

// Test: ISO strings convert, DateTime values pass through
bool test_datetime_type_accepts() {
    DateTime dt{.year = 2013, .month = 8, .day = 21};
    return ConvertsTo(DateTimeType(), "2013-08-21", dt)
        && ConvertsTo(DateTimeType(), dt, dt);
}

// Test: non-ISO input is rejected with the offending value
bool test_datetime_type_rejects() {
    Field f = DateTimeType();
    return ConvertFailsWithMessage(f, "yesterday", ErrorCode::conversion_error,
                                   "Could not parse 'yesterday'. Should be ISO8601.")
        && ConvertFailsWithMessage(f, 12, ErrorCode::conversion_error,
                                   "Could not parse 12. Should be ISO8601.")
        && ConvertFailsWith(f, nullptr, ErrorCode::conversion_error);
}

int main() {
    Runner r("types/datetime");
    r.check(test_parse_date_only(), "date-only input is midnight");
    r.check(test_parse_microseconds(), "full timestamp with microseconds");
    r.check(test_parse_fraction_scaling(), "short fractions are scaled, long ones truncated");
    r.check(test_parse_space_separator(), "space separator and minutes-only time");
    r.check(test_parse_offsets(), "UTC designator and numeric offsets");
    r.check(test_parse_rejects(), "malformed and out-of-range input is rejected");
    r.check(test_parse_leap_day(), "leap day is accepted in leap years");
    r.check(test_aware_equality(), "offset-carrying timestamps compare as instants");
    r.check(test_iso_rendering(), "fraction appears only when non-zero");
    r.check(test_iso_offset_rendering(), "offsets render as +HH:MM");
    r.check(test_iso_round_trip(), "ISO rendering parses back at microsecond precision");
    r.check(test_time_point_bridge(), "time_point bridge");
    r.check(test_datetime_type_accepts(), "ISO strings convert, DateTime values pass through");
    r.check(test_datetime_type_rejects(), "non-ISO input is rejected with the offending value");
    return r.finish();
}
