// =============================================================================
// ParamValue Unit Tests
// Typed parsing of terminal parameters and their provider text form
// =============================================================================

#include <gtest/gtest.h>

#include "../src/bridge/translator/param_value.hpp"

namespace tr = bridge::translator;
using bridge::registry::ParamSpec;
using bridge::registry::ParamType;

namespace {
    ParamSpec spec_of(ParamType type) {
        ParamSpec spec;
        spec.name_ = "p";
        spec.type_ = type;
        return spec;
    }
}  // namespace

// -----------------------------------------------------------------------------
// ParseDate_RealCalendarDatesOnly
// -----------------------------------------------------------------------------
TEST(ParamValueTest, ParseDate_RealCalendarDatesOnly) {
    EXPECT_TRUE(tr::parse_date("2024-02-29").has_value());
    EXPECT_FALSE(tr::parse_date("2023-02-29").has_value());
    EXPECT_FALSE(tr::parse_date("2024-13-01").has_value());
    EXPECT_FALSE(tr::parse_date("2024-1-01").has_value());
    EXPECT_FALSE(tr::parse_date("2024/01/01").has_value());
    EXPECT_FALSE(tr::parse_date("").has_value());
}

// -----------------------------------------------------------------------------
// ParseNumber_FiniteDecimalsOnly
// -----------------------------------------------------------------------------
TEST(ParamValueTest, ParseNumber_FiniteDecimalsOnly) {
    EXPECT_DOUBLE_EQ(tr::parse_number("42").value_or(0), 42.0);
    EXPECT_DOUBLE_EQ(tr::parse_number("-1.5").value_or(0), -1.5);
    EXPECT_DOUBLE_EQ(tr::parse_number("2e3").value_or(0), 2000.0);
    EXPECT_FALSE(tr::parse_number("12abc").has_value());
    EXPECT_FALSE(tr::parse_number(" 12").has_value());
    EXPECT_FALSE(tr::parse_number("nan").has_value());
    EXPECT_FALSE(tr::parse_number("inf").has_value());
    EXPECT_FALSE(tr::parse_number("0x10").has_value());
    EXPECT_FALSE(tr::parse_number("1e999").has_value());
}

// -----------------------------------------------------------------------------
// ParseBoolean_AcceptsWordsAndDigits
// -----------------------------------------------------------------------------
TEST(ParamValueTest, ParseBoolean_AcceptsWordsAndDigits) {
    EXPECT_EQ(tr::parse_boolean("true"), std::optional<bool>(true));
    EXPECT_EQ(tr::parse_boolean("FALSE"), std::optional<bool>(false));
    EXPECT_EQ(tr::parse_boolean("1"), std::optional<bool>(true));
    EXPECT_EQ(tr::parse_boolean("0"), std::optional<bool>(false));
    EXPECT_FALSE(tr::parse_boolean("yes").has_value());
}

// -----------------------------------------------------------------------------
// ParseParamValue_String_TrimsAndUppercases
// -----------------------------------------------------------------------------
TEST(ParamValueTest, ParseParamValue_String_TrimsAndUppercases) {
    auto spec = spec_of(ParamType::STRING);
    spec.uppercase_ = true;

    const auto value = tr::parse_param_value(spec, "  aapl ");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(std::get<std::string>(*value), "AAPL");
    EXPECT_FALSE(tr::parse_param_value(spec, "   ").has_value());
}

// -----------------------------------------------------------------------------
// ParseParamValue_Enum_MustBeAnOption
// -----------------------------------------------------------------------------
TEST(ParamValueTest, ParseParamValue_Enum_MustBeAnOption) {
    auto spec = spec_of(ParamType::ENUM);
    spec.options_ = {{"Full", "full"}, {"Brief", "brief"}};

    EXPECT_TRUE(tr::parse_param_value(spec, "brief").has_value());
    EXPECT_FALSE(tr::parse_param_value(spec, "Brief").has_value());
    EXPECT_FALSE(tr::parse_param_value(spec, "other").has_value());
}

// -----------------------------------------------------------------------------
// ToUpstreamString_CanonicalForms
// -----------------------------------------------------------------------------
TEST(ParamValueTest, ToUpstreamString_CanonicalForms) {
    EXPECT_EQ(tr::to_upstream_string(tr::ParamValue{30.0}), "30");
    EXPECT_EQ(tr::to_upstream_string(tr::ParamValue{2.5}), "2.5");
    EXPECT_EQ(tr::to_upstream_string(tr::ParamValue{true}), "true");
    EXPECT_EQ(tr::to_upstream_string(tr::ParamValue{std::string("AAPL")}), "AAPL");
    EXPECT_EQ(tr::to_upstream_string(tr::ParamValue{tr::EnumValue{"brief"}}), "brief");
    EXPECT_EQ(tr::to_upstream_string(tr::ParamValue{*tr::parse_date("2024-03-05")}), "2024-03-05");
}
