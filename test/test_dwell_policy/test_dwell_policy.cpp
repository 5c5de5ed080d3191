#include <unity.h>
#include "idasen_tray/dwell_policy.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace idasen_tray;
using namespace std::chrono_literals;

template<typename Ex, typename Fn>
static bool throwsA(Fn fn) {
    try {
        fn();
    } catch (const Ex&) {
        return true;
    }
    return false;
}

void setUp() {}
void tearDown() {}

// =============================================================================
// DwellPolicy
// =============================================================================

void test_minutes_are_converted_to_milliseconds() {
    auto policy = DwellPolicy::fromMinutes({"stand", "sit"}, {1.0, 0.5});

    TEST_ASSERT_TRUE(policy.lookup("stand").has_value());
    TEST_ASSERT_EQUAL(60000, static_cast<int>(policy.lookup("stand")->count()));
    TEST_ASSERT_EQUAL(30000, static_cast<int>(policy.lookup("sit")->count()));
}

void test_unknown_position_has_no_dwell() {
    auto policy = DwellPolicy::fromMinutes({"stand"}, {1.0});

    TEST_ASSERT_FALSE(policy.lookup("sit").has_value());
}

void test_zero_minutes_disables_nagging_for_position() {
    auto policy = DwellPolicy::fromMinutes({"stand", "sit"}, {0.0, 1.0});

    TEST_ASSERT_FALSE(policy.lookup("stand").has_value());
    TEST_ASSERT_TRUE(policy.lookup("sit").has_value());
    TEST_ASSERT_FALSE(policy.empty());
}

void test_negative_minutes_are_rejected() {
    TEST_ASSERT_TRUE(throwsA<std::invalid_argument>([] {
        DwellPolicy::fromMinutes({"stand"}, {-1.0});
    }));
    TEST_ASSERT_TRUE(throwsA<std::invalid_argument>([] {
        DwellPolicy policy;
        policy.set("sit", -1ms);
    }));
}

void test_non_finite_minutes_are_rejected() {
    TEST_ASSERT_TRUE(throwsA<std::invalid_argument>([] {
        DwellPolicy::fromMinutes({"stand"}, {std::nan("")});
    }));
    TEST_ASSERT_TRUE(throwsA<std::invalid_argument>([] {
        DwellPolicy::fromMinutes({"stand"}, {std::numeric_limits<double>::infinity()});
    }));
}

void test_minutes_above_one_day_are_rejected() {
    TEST_ASSERT_TRUE(throwsA<std::invalid_argument>([] {
        DwellPolicy::fromMinutes({"stand"}, {1e300});
    }));
    TEST_ASSERT_TRUE(throwsA<std::invalid_argument>([] {
        DwellPolicy::fromMinutes({"stand"}, {DwellPolicy::kMaxMinutes + 1.0});
    }));

    auto policy = DwellPolicy::fromMinutes({"stand"}, {DwellPolicy::kMaxMinutes});
    TEST_ASSERT_EQUAL(86400000, static_cast<int>(policy.lookup("stand")->count()));
}

void test_minutes_below_one_millisecond_are_rejected() {
    // Would otherwise truncate to zero and silently disable nagging
    TEST_ASSERT_TRUE(throwsA<std::invalid_argument>([] {
        DwellPolicy::fromMinutes({"stand"}, {1e-6});
    }));

    auto policy = DwellPolicy::fromMinutes({"stand"}, {0.001});
    TEST_ASSERT_EQUAL(60, static_cast<int>(policy.lookup("stand")->count()));
}

void test_mismatched_lengths_are_rejected() {
    TEST_ASSERT_TRUE(throwsA<std::invalid_argument>([] {
        DwellPolicy::fromMinutes({"stand", "sit"}, {1.0});
    }));
}

void test_empty_name_is_rejected() {
    TEST_ASSERT_TRUE(throwsA<std::invalid_argument>([] {
        DwellPolicy::fromMinutes({""}, {1.0});
    }));
}

void test_default_policy_is_empty() {
    DwellPolicy policy;

    TEST_ASSERT_TRUE(policy.empty());
    TEST_ASSERT_FALSE(policy.lookup("sit").has_value());
}

// =============================================================================
// TogglePair
// =============================================================================

void test_complement_is_symmetric() {
    TogglePair pair("sit", "stand");

    TEST_ASSERT_EQUAL_STRING("stand", pair.complementOf("sit")->c_str());
    TEST_ASSERT_EQUAL_STRING("sit", pair.complementOf("stand")->c_str());
}

void test_position_outside_pair_has_no_complement() {
    TogglePair pair("sit", "stand");

    TEST_ASSERT_FALSE(pair.complementOf("focus").has_value());
    TEST_ASSERT_FALSE(pair.complementOf("").has_value());
}

void test_pair_needs_two_distinct_names() {
    TEST_ASSERT_TRUE(throwsA<std::invalid_argument>([] { TogglePair("sit", "sit"); }));
    TEST_ASSERT_TRUE(throwsA<std::invalid_argument>([] { TogglePair("", "stand"); }));
}

void test_pair_from_list_needs_exactly_two() {
    TEST_ASSERT_TRUE(throwsA<std::invalid_argument>([] {
        TogglePair::fromList({"sit", "stand", "focus"});
    }));
    TEST_ASSERT_TRUE(throwsA<std::invalid_argument>([] {
        TogglePair::fromList({"sit"});
    }));

    auto pair = TogglePair::fromList({"low", "high"});
    TEST_ASSERT_EQUAL_STRING("low", pair.first().c_str());
    TEST_ASSERT_EQUAL_STRING("high", pair.second().c_str());
}

// =============================================================================
// Test Runner
// =============================================================================

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_minutes_are_converted_to_milliseconds);
    RUN_TEST(test_unknown_position_has_no_dwell);
    RUN_TEST(test_zero_minutes_disables_nagging_for_position);
    RUN_TEST(test_negative_minutes_are_rejected);
    RUN_TEST(test_non_finite_minutes_are_rejected);
    RUN_TEST(test_minutes_above_one_day_are_rejected);
    RUN_TEST(test_minutes_below_one_millisecond_are_rejected);
    RUN_TEST(test_mismatched_lengths_are_rejected);
    RUN_TEST(test_empty_name_is_rejected);
    RUN_TEST(test_default_policy_is_empty);

    RUN_TEST(test_complement_is_symmetric);
    RUN_TEST(test_position_outside_pair_has_no_complement);
    RUN_TEST(test_pair_needs_two_distinct_names);
    RUN_TEST(test_pair_from_list_needs_exactly_two);

    return UNITY_END();
}
