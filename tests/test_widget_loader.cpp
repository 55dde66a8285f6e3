// =============================================================================
// WidgetLoader / WidgetRegistry Unit Tests
// Registry file parsing and every load-time rejection
// =============================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "../src/bridge/registry/widget_loader.hpp"
#include "../src/bridge/registry/widget_registry.hpp"
#include "test_support.hpp"

using bridge::registry::RegistryError;
using bridge::registry::WidgetLoader;

namespace {
    // Wraps one widget body in a registry document.
    std::string registry_with(const std::string& widget) { return R"({"widgets": [)" + widget + "]}"; }

    constexpr const char* COLUMNS = R"("columns": [{ "field": "symbol" }])";
    constexpr const char* PROVIDER = R"("provider": { "namespace": "CORE", "dataset": "STOCK_STATS_US" })";
}  // namespace

// -----------------------------------------------------------------------------
// ParseJson_TestRegistry_KeepsFileOrderAndFields
// -----------------------------------------------------------------------------
TEST(WidgetLoaderTest, ParseJson_TestRegistry_KeepsFileOrderAndFields) {
    const auto registry = WidgetLoader::parse_json(test_support::TEST_REGISTRY_JSON);

    ASSERT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.widgets()[0].id_, "quote");
    EXPECT_EQ(registry.widgets()[1].id_, "stats");

    const auto* quote = registry.find("quote");
    ASSERT_NE(quote, nullptr);
    EXPECT_EQ(quote->type_, bridge::registry::WidgetType::TABLE);
    EXPECT_EQ(quote->target_.namespace_, "CORE");
    EXPECT_EQ(quote->target_.dataset_, "STOCK_STATS_US");
    ASSERT_TRUE(quote->target_.last_.has_value());
    EXPECT_EQ(*quote->target_.last_, 1);
    ASSERT_EQ(quote->params_.size(), 1u);
    EXPECT_EQ(quote->params_[0].binding_, bridge::registry::ParamBinding::PATH);
    EXPECT_TRUE(quote->params_[0].required_);
    EXPECT_TRUE(quote->params_[0].uppercase_);
    ASSERT_EQ(quote->columns_.size(), 4u);
    EXPECT_EQ(quote->columns_[3].type_, bridge::registry::ColumnType::INTEGER);

    const auto* stats = registry.find("stats");
    ASSERT_NE(stats, nullptr);
    EXPECT_EQ(stats->type_, bridge::registry::WidgetType::METRIC);
    EXPECT_FALSE(stats->target_.last_.has_value());
    EXPECT_EQ(stats->category_, "Vianexus");
    EXPECT_EQ(stats->grid_.w_, 12);

    const auto* rows = stats->find_param("rows");
    ASSERT_NE(rows, nullptr);
    EXPECT_EQ(rows->default_.value_or(""), "1");
    EXPECT_EQ(rows->upstream_name_, "last");

    const auto* view = stats->find_param("view");
    ASSERT_NE(view, nullptr);
    ASSERT_EQ(view->options_.size(), 2u);
    EXPECT_EQ(view->options_[1].label_, "Brief");

    EXPECT_EQ(stats->find_param("adjusted")->default_.value_or(""), "false");
    EXPECT_EQ(stats->columns_[2].format_, bridge::registry::ColumnFormat::PERCENT);
    EXPECT_EQ(stats->columns_[3].description_, "Float");
    EXPECT_EQ(stats->columns_[0].header_name_, "Company");
}

// -----------------------------------------------------------------------------
// LoadFromFile_ShippedRegistry_Loads
// -----------------------------------------------------------------------------
TEST(WidgetLoaderTest, LoadFromFile_ShippedRegistry_Loads) {
    const auto registry = WidgetLoader::load_from_file(std::string(NEXUS_BRIDGE_SOURCE_DIR) + "/config/widgets.json");

    ASSERT_NE(registry.find("stock_stats"), nullptr);
    ASSERT_NE(registry.find("quote"), nullptr);
    EXPECT_EQ(registry.find("stock_stats")->params_[0].default_.value_or(""), "AAPL");
}

// -----------------------------------------------------------------------------
// LoadFromFile_MissingFile_Throws
// -----------------------------------------------------------------------------
TEST(WidgetLoaderTest, LoadFromFile_MissingFile_Throws) {
    EXPECT_THROW(static_cast<void>(WidgetLoader::load_from_file("/nonexistent/widgets.json")), RegistryError);
}

// -----------------------------------------------------------------------------
// ParseJson_NotJsonOrNoWidgetsArray_Throws
// -----------------------------------------------------------------------------
TEST(WidgetLoaderTest, ParseJson_NotJsonOrNoWidgetsArray_Throws) {
    EXPECT_THROW(static_cast<void>(WidgetLoader::parse_json("{ nope")), RegistryError);
    EXPECT_THROW(static_cast<void>(WidgetLoader::parse_json(R"({"items": []})")), RegistryError);
    EXPECT_THROW(static_cast<void>(WidgetLoader::parse_json("[]")), RegistryError);
}

// -----------------------------------------------------------------------------
// ParseJson_EmptyWidgetList_IsEmptyRegistry
// -----------------------------------------------------------------------------
TEST(WidgetLoaderTest, ParseJson_EmptyWidgetList_IsEmptyRegistry) {
    EXPECT_TRUE(WidgetLoader::parse_json(R"({"widgets": []})").empty());
}

// -----------------------------------------------------------------------------
// ParseJson_DuplicateId_Throws
// -----------------------------------------------------------------------------
TEST(WidgetLoaderTest, ParseJson_DuplicateId_Throws) {
    const std::string widget = std::string(R"({"id": "a", "name": "A", "type": "table", )") + PROVIDER + ", " + COLUMNS + "}";
    EXPECT_THROW(static_cast<void>(WidgetLoader::parse_json(R"({"widgets": [)" + widget + "," + widget + "]}")), RegistryError);
}

// -----------------------------------------------------------------------------
// ParseJson_UnknownWidgetType_Throws
// -----------------------------------------------------------------------------
TEST(WidgetLoaderTest, ParseJson_UnknownWidgetType_Throws) {
    const std::string widget = std::string(R"({"id": "a", "name": "A", "type": "chart", )") + PROVIDER + ", " + COLUMNS + "}";
    EXPECT_THROW(static_cast<void>(WidgetLoader::parse_json(registry_with(widget))), RegistryError);
}

// -----------------------------------------------------------------------------
// ParseJson_IdWithPathCharacters_Throws
// -----------------------------------------------------------------------------
TEST(WidgetLoaderTest, ParseJson_IdWithPathCharacters_Throws) {
    const std::string widget = std::string(R"({"id": "widgets.json", "name": "A", "type": "table", )") + PROVIDER + ", " + COLUMNS + "}";
    EXPECT_THROW(static_cast<void>(WidgetLoader::parse_json(registry_with(widget))), RegistryError);
}

// -----------------------------------------------------------------------------
// ParseJson_NoColumns_Throws
// -----------------------------------------------------------------------------
TEST(WidgetLoaderTest, ParseJson_NoColumns_Throws) {
    const std::string widget = std::string(R"({"id": "a", "name": "A", "type": "table", "columns": [], )") + PROVIDER + "}";
    EXPECT_THROW(static_cast<void>(WidgetLoader::parse_json(registry_with(widget))), RegistryError);

    const std::string missing = std::string(R"({"id": "a", "name": "A", "type": "table", )") + PROVIDER + "}";
    EXPECT_THROW(static_cast<void>(WidgetLoader::parse_json(registry_with(missing))), RegistryError);
}

// -----------------------------------------------------------------------------
// ParseJson_MissingProvider_Throws
// -----------------------------------------------------------------------------
TEST(WidgetLoaderTest, ParseJson_MissingProvider_Throws) {
    const std::string widget = std::string(R"({"id": "a", "name": "A", "type": "table", )") + COLUMNS + "}";
    EXPECT_THROW(static_cast<void>(WidgetLoader::parse_json(registry_with(widget))), RegistryError);
}

// -----------------------------------------------------------------------------
// ParseJson_InvalidDefault_Throws
// -----------------------------------------------------------------------------
TEST(WidgetLoaderTest, ParseJson_InvalidDefault_Throws) {
    const std::string widget = std::string(R"({"id": "a", "name": "A", "type": "table", )") + PROVIDER + ", " + COLUMNS +
                               R"(, "params": [{ "name": "since", "type": "date", "default": "2024-02-30" }]})";
    EXPECT_THROW(static_cast<void>(WidgetLoader::parse_json(registry_with(widget))), RegistryError);
}

// -----------------------------------------------------------------------------
// ParseJson_EnumWithoutOptions_Throws
// -----------------------------------------------------------------------------
TEST(WidgetLoaderTest, ParseJson_EnumWithoutOptions_Throws) {
    const std::string widget = std::string(R"({"id": "a", "name": "A", "type": "table", )") + PROVIDER + ", " + COLUMNS +
                               R"(, "params": [{ "name": "view", "type": "enum" }]})";
    EXPECT_THROW(static_cast<void>(WidgetLoader::parse_json(registry_with(widget))), RegistryError);
}

// -----------------------------------------------------------------------------
// ParseJson_TwoPathParams_Throws
// -----------------------------------------------------------------------------
TEST(WidgetLoaderTest, ParseJson_TwoPathParams_Throws) {
    const std::string widget = std::string(R"({"id": "a", "name": "A", "type": "table", )") + PROVIDER + ", " + COLUMNS +
                               R"(, "params": [{ "name": "x", "binding": "path" }, { "name": "y", "binding": "path" }]})";
    EXPECT_THROW(static_cast<void>(WidgetLoader::parse_json(registry_with(widget))), RegistryError);
}

// -----------------------------------------------------------------------------
// ParseJson_UnknownColumnTypeOrFormat_Throws
// -----------------------------------------------------------------------------
TEST(WidgetLoaderTest, ParseJson_UnknownColumnTypeOrFormat_Throws) {
    const std::string bad_type = std::string(R"({"id": "a", "name": "A", "type": "table", )") + PROVIDER +
                                 R"(, "columns": [{ "field": "x", "type": "decimal" }]})";
    EXPECT_THROW(static_cast<void>(WidgetLoader::parse_json(registry_with(bad_type))), RegistryError);

    const std::string bad_format = std::string(R"({"id": "a", "name": "A", "type": "table", )") + PROVIDER +
                                   R"(, "columns": [{ "field": "x", "format": "money" }]})";
    EXPECT_THROW(static_cast<void>(WidgetLoader::parse_json(registry_with(bad_format))), RegistryError);
}

// -----------------------------------------------------------------------------
// Registry_AddDuplicate_Throws
// -----------------------------------------------------------------------------
TEST(WidgetRegistryTest, Registry_AddDuplicate_Throws) {
    bridge::registry::WidgetRegistry registry;
    bridge::registry::WidgetDescriptor widget;
    widget.id_ = "a";

    registry.add(widget);
    EXPECT_THROW(registry.add(widget), std::invalid_argument);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find("b"), nullptr);
}
