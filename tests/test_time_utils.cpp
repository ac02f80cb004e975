#include <cassert>
#include <iostream>

#include "../include/util/string_utils.hpp"
#include "../include/util/time_utils.hpp"

using namespace mpt;
using namespace mpt::util;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

static_assert(days_from_civil(1970, 1, 1) == 0);
static_assert(civil_from_days(19797) == CivilDate{2024, 3, 15});
static_assert(weekday_from_days(0) == 4); // Thursday

TEST(civil_date_round_trip_across_leap_years) {
    for (int64_t day = days_from_civil(1999, 12, 25); day < days_from_civil(2001, 3, 5); ++day) {
        CivilDate d = civil_from_days(day);
        ASSERT_EQ(days_from_civil(d.year, d.month, d.day), day);
    }
    ASSERT_EQ(civil_from_days(days_from_civil(2024, 2, 29)), (CivilDate{2024, 2, 29}));
    ASSERT_EQ(days_from_civil(2024, 3, 1) - days_from_civil(2024, 2, 28), 2);
}

TEST(eastern_session_times) {
    // Winter: EST (UTC-5). 2024-01-02 09:30 ET = 14:30Z
    ASSERT_EQ(format_utc(eastern_to_utc_ns({2024, 1, 2}, 9, 30)), std::string("2024-01-02T14:30:00Z"));
    // Summer: EDT (UTC-4). 2024-07-01 16:00 ET = 20:00Z
    ASSERT_EQ(format_utc(eastern_to_utc_ns({2024, 7, 1}, 16, 0)), std::string("2024-07-01T20:00:00Z"));
    // First trading day after the March switch
    ASSERT_EQ(format_utc(eastern_to_utc_ns({2024, 3, 11}, 9, 30)), std::string("2024-03-11T13:30:00Z"));
    // First trading day after the November switch
    ASSERT_EQ(format_utc(eastern_to_utc_ns({2024, 11, 4}, 9, 30)), std::string("2024-11-04T14:30:00Z"));
}

TEST(eastern_date_is_exchange_today) {
    // 2024-03-16 02:00Z is still the 15th in New York
    Timestamp late = eastern_to_utc_ns({2024, 3, 15}, 22, 0);
    ASSERT_EQ(eastern_date(late), (CivilDate{2024, 3, 15}));
    ASSERT_EQ(format_utc(late), std::string("2024-03-16T02:00:00Z"));

    ASSERT_EQ(eastern_date(eastern_to_utc_ns({2024, 3, 16}, 0, 1)), (CivilDate{2024, 3, 16}));
}

TEST(dst_boundaries) {
    // 2024: DST from 2024-03-10 07:00Z to 2024-11-03 06:00Z
    const int64_t start = days_from_civil(2024, 3, 10) * 86400 + 7 * 3600;
    const int64_t end = days_from_civil(2024, 11, 3) * 86400 + 6 * 3600;
    ASSERT_FALSE(is_eastern_dst(start - 1));
    ASSERT_TRUE(is_eastern_dst(start));
    ASSERT_TRUE(is_eastern_dst(end - 1));
    ASSERT_FALSE(is_eastern_dst(end));
}

TEST(parse_dates_and_times) {
    ASSERT_EQ(*parse_date("2024-03-15"), (CivilDate{2024, 3, 15}));
    ASSERT_FALSE(parse_date("2024-13-01").has_value());
    ASSERT_FALSE(parse_date("03/15/2024").has_value());
    ASSERT_FALSE(parse_date("").has_value());

    ASSERT_EQ(*parse_hhmm("09:30"), 570);
    ASSERT_EQ(*parse_hhmm("16:00"), 960);
    ASSERT_FALSE(parse_hhmm("24:00").has_value());
    ASSERT_FALSE(parse_hhmm("noon").has_value());

    ASSERT_EQ(format_date({2024, 3, 5}), std::string("2024-03-05"));
}

TEST(parse_rfc3339_timestamps) {
    const Timestamp open = eastern_to_utc_ns({2024, 3, 11}, 9, 30);
    ASSERT_EQ(*parse_rfc3339("2024-03-11T13:30:00Z"), open);
    ASSERT_EQ(*parse_rfc3339("2024-03-11T09:30:00-04:00"), open);
    ASSERT_EQ(*parse_rfc3339("2024-03-11T13:30:00.250Z"), open + 250 * NS_PER_MS);
    ASSERT_FALSE(parse_rfc3339("2024-03-11T13:30:00").has_value());
    ASSERT_FALSE(parse_rfc3339("yesterday").has_value());
}

TEST(wall_clock_is_after_2020) {
    ASSERT_TRUE(wall_clock_ns() > eastern_to_utc_ns({2020, 1, 1}, 0, 0));
}

TEST(symbol_normalization) {
    ASSERT_EQ(normalize_symbol("  aapl \n"), std::string("AAPL"));
    ASSERT_EQ(normalize_symbol("brk.b"), std::string("BRK.B"));
    ASSERT_EQ(normalize_symbol("   "), std::string(""));

    ASSERT_EQ(split_symbols("aapl, MSFT,,  nvda "), (std::vector<std::string>{"AAPL", "MSFT", "NVDA"}));
    ASSERT_TRUE(split_symbols("").empty());
    ASSERT_EQ(join({"AAPL", "MSFT"}, ","), std::string("AAPL,MSFT"));
    ASSERT_EQ(join({}, ","), std::string(""));
}

TEST(run_id_rendering) {
    ASSERT_EQ(run_id_to_string(0xABCULL), std::string("0000000000000abc"));
    ASSERT_EQ(run_id_to_string(~0ULL), std::string("ffffffffffffffff"));
}

int main() {
    std::cout << "\n=== Time Utils Tests ===\n\n";

    RUN_TEST(civil_date_round_trip_across_leap_years);
    RUN_TEST(eastern_session_times);
    RUN_TEST(eastern_date_is_exchange_today);
    RUN_TEST(dst_boundaries);
    RUN_TEST(parse_dates_and_times);
    RUN_TEST(parse_rfc3339_timestamps);
    RUN_TEST(wall_clock_is_after_2020);
    RUN_TEST(symbol_normalization);
    RUN_TEST(run_id_rendering);

    std::cout << "\n=== All Time Utils Tests Passed! ===\n";
    return 0;
}
