#include "suid/id/serialization.h"

#include <cstdint>
#include <string>

#include <gtest/gtest.h>

namespace suid {
namespace {

Suid SampleSuid() {
    auto id = Suid::FromFields(1745400001, 12345, 42);
    EXPECT_TRUE(id.ok());
    return id.ok() ? *id : Suid();
}

Guid SampleGuid() {
    auto id = Guid::FromFields(3, 1770904743122773, 0x1abcd, 0x55);
    EXPECT_TRUE(id.ok());
    return id.ok() ? *id : Guid();
}

TEST(JsonTest, SuidIsQuotedText) {
    const Suid id = SampleSuid();
    const std::string json = ToJson(id);
    EXPECT_EQ(json.size(), Suid::kTextLength + 2);
    EXPECT_EQ(json, "\"" + id.ToText() + "\"");

    auto parsed = SuidFromJson(json);
    ASSERT_TRUE(parsed.ok()) << parsed.status();
    EXPECT_EQ(*parsed, id);
}

TEST(JsonTest, GuidIsQuotedText) {
    const Guid id = SampleGuid();
    const std::string json = ToJson(id);
    EXPECT_EQ(json.size(), Guid::kTextLength + 2);

    auto parsed = GuidFromJson(json);
    ASSERT_TRUE(parsed.ok()) << parsed.status();
    EXPECT_EQ(*parsed, id);
}

TEST(JsonTest, RejectsUnquotedOrWrongLength) {
    const std::string text = SampleSuid().ToText();
    EXPECT_FALSE(SuidFromJson(text).ok());
    EXPECT_FALSE(SuidFromJson("\"" + text).ok());
    EXPECT_FALSE(SuidFromJson("\"" + text + "1\"").ok());
    EXPECT_FALSE(SuidFromJson("12345").ok());
    EXPECT_FALSE(SuidFromJson("").ok());

    EXPECT_FALSE(GuidFromJson("\"" + SampleGuid().ToText().substr(1) + "\"").ok());
    EXPECT_FALSE(GuidFromJson("null").ok());
}

TEST(JsonTest, RejectsInvalidCharactersInsideQuotes) {
    auto status = SuidFromJson("\"111111111111!\"").status();
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
}

TEST(SqlTest, ColumnTypes) {
    EXPECT_EQ(kSuidSqlType, "BIGINT");
    EXPECT_EQ(kGuidSqlType, "CHAR(16)");
}

TEST(SqlTest, SuidIsStoredAsInteger) {
    const Suid id = SampleSuid();
    const int64_t value = ToSqlValue(id);
    EXPECT_EQ(value, id.ToRaw());
    EXPECT_GT(value, 0);

    auto parsed = SuidFromSqlValue(value);
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(*parsed, id);
}

TEST(SqlTest, NegativeSuidValuesAreRejected) {
    auto parsed = SuidFromSqlValue(-1);
    ASSERT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(SqlTest, GuidIsStoredAsText) {
    const Guid id = SampleGuid();
    const std::string value = ToSqlValue(id);
    EXPECT_EQ(value.size(), 16u);

    auto parsed = GuidFromSqlValue(value);
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(*parsed, id);

    EXPECT_FALSE(GuidFromSqlValue("too-short").ok());
}

}  // namespace
}  // namespace suid
