// =============================================================================
// string_utils Unit Tests
// Query string handling, URL escaping and token redaction
// =============================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "../src/utils/string_utils.hpp"

namespace su = string_utils;

// -----------------------------------------------------------------------------
// ParseQueryString_DecodesPairsInOrder
// -----------------------------------------------------------------------------
TEST(StringUtilsTest, ParseQueryString_DecodesPairsInOrder) {
    const auto pairs = su::parse_query_string("symbol=AAPL%2CMSFT&name=hello+world&flag");

    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0].first, "symbol");
    EXPECT_EQ(pairs[0].second, "AAPL,MSFT");
    EXPECT_EQ(pairs[1].second, "hello world");
    EXPECT_EQ(pairs[2].first, "flag");
    EXPECT_EQ(pairs[2].second, "");
}

// -----------------------------------------------------------------------------
// ParseQueryString_EmptyInput_ReturnsNothing
// -----------------------------------------------------------------------------
TEST(StringUtilsTest, ParseQueryString_EmptyInput_ReturnsNothing) {
    EXPECT_TRUE(su::parse_query_string("").empty());
    EXPECT_TRUE(su::parse_query_string("&&").empty());
}

// -----------------------------------------------------------------------------
// UrlDecode_BrokenEscape_Throws
// -----------------------------------------------------------------------------
TEST(StringUtilsTest, UrlDecode_BrokenEscape_Throws) {
    EXPECT_THROW(su::url_decode("abc%4"), std::invalid_argument);
    EXPECT_THROW(su::url_decode("%zz"), std::invalid_argument);
    EXPECT_EQ(su::url_decode("%41"), "A");
}

// -----------------------------------------------------------------------------
// UrlEncode_KeepsUnreservedOnly
// -----------------------------------------------------------------------------
TEST(StringUtilsTest, UrlEncode_KeepsUnreservedOnly) {
    EXPECT_EQ(su::url_encode("BRK.B"), "BRK.B");
    EXPECT_EQ(su::url_encode("a b/c"), "a%20b%2Fc");
    EXPECT_EQ(su::url_encode("x&y=z"), "x%26y%3Dz");
}

// -----------------------------------------------------------------------------
// RedactQueryParam_HidesOnlyTheNamedValue
// -----------------------------------------------------------------------------
TEST(StringUtilsTest, RedactQueryParam_HidesOnlyTheNamedValue) {
    EXPECT_EQ(su::redact_query_param("https://h/data?token=abc&last=1", "token"), "https://h/data?token=***&last=1");
    EXPECT_EQ(su::redact_query_param("https://h/data?last=1&token=abc", "token"), "https://h/data?last=1&token=***");
    EXPECT_EQ(su::redact_query_param("https://h/data", "token"), "https://h/data");
}

// -----------------------------------------------------------------------------
// FindHeader_IsCaseInsensitive
// -----------------------------------------------------------------------------
TEST(StringUtilsTest, FindHeader_IsCaseInsensitive) {
    const su::HeaderPairs headers = {{"Content-Type", "application/json"}, {"x-api-key", "k"}};

    EXPECT_EQ(su::find_header(headers, "X-API-Key").value_or(""), "k");
    EXPECT_EQ(su::find_header(headers, "content-type").value_or(""), "application/json");
    EXPECT_FALSE(su::find_header(headers, "Authorization").has_value());
}

// -----------------------------------------------------------------------------
// SplitCommaDelimited_TrimsAndSkipsEmpty
// -----------------------------------------------------------------------------
TEST(StringUtilsTest, SplitCommaDelimited_TrimsAndSkipsEmpty) {
    const auto parts = su::split_comma_delimited_string(" AAPL, MSFT ,,GOOGL ");

    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "AAPL");
    EXPECT_EQ(parts[1], "MSFT");
    EXPECT_EQ(parts[2], "GOOGL");
}

// -----------------------------------------------------------------------------
// IeqPrefix_HeaderBytes
// -----------------------------------------------------------------------------
TEST(StringUtilsTest, IeqPrefix_HeaderBytes) {
    const std::string line = "X-RateLimit-Remaining: 42\r\n";
    EXPECT_TRUE(su::ieq_prefix(line.data(), line.size(), "x-ratelimit-remaining:"));
    EXPECT_FALSE(su::ieq_prefix(line.data(), 5, "x-ratelimit-remaining:"));

    const std::string high_bytes = "\xC3\xA9tag: v\r\n";
    EXPECT_FALSE(su::ieq_prefix(high_bytes.data(), high_bytes.size(), "etag:"));
}
