#include "suid/id/suid.h"

#include <array>
#include <cstdint>
#include <sstream>
#include <tuple>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace suid {
namespace {

using ::testing::HasSubstr;

constexpr uint64_t kTime = 1745400001;

TEST(SuidTest, PacksKnownFields) {
    auto id = Suid::FromFields(kTime, 5, 3);
    ASSERT_TRUE(id.ok()) << id.status();

    const uint64_t expected = (kTime << 30) | (uint64_t{5} << 8) | 3;
    EXPECT_EQ(id->value(), expected);
    EXPECT_EQ(id->ToRaw(), static_cast<int64_t>(expected));
    EXPECT_EQ(id->Time(), kTime);
    EXPECT_EQ(id->Sequence(), 5u);
    EXPECT_EQ(id->Host(), 3u);
    EXPECT_EQ(id->Reserved(), 0u);
}

TEST(SuidTest, KnownFieldsSurviveTextForm) {
    auto id = Suid::FromFields(kTime, 5, 3);
    ASSERT_TRUE(id.ok());

    const std::string text = id->ToText();
    EXPECT_EQ(text.size(), Suid::kTextLength);

    auto decoded = Suid::FromText(text);
    ASSERT_TRUE(decoded.ok()) << decoded.status();
    EXPECT_EQ(decoded->ToRaw(), static_cast<int64_t>((kTime << 30) | (uint64_t{5} << 8) | 3));
    EXPECT_EQ(*decoded, *id);
}

TEST(SuidTest, FromFieldsRejectsOverflow) {
    EXPECT_EQ(Suid::FromFields(uint64_t{1} << 33, 0, 0).status().code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(Suid::FromFields(kTime, uint64_t{1} << 22, 0).status().code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(Suid::FromFields(kTime, 0, 256).status().code(),
              absl::StatusCode::kInvalidArgument);
}

TEST(SuidTest, BoundaryFieldsRoundTrip) {
    const uint64_t max_time = (uint64_t{1} << 33) - 1;
    const uint64_t max_seq = (uint64_t{1} << 22) - 1;
    const std::vector<std::tuple<uint64_t, uint64_t, uint64_t>> cases = {
        {0, 0, 0},
        {max_time, max_seq, 255},
        {max_time, 0, 0},
        {0, max_seq, 0},
        {0, 0, 255},
    };
    for (const auto& [time, seq, host] : cases) {
        auto id = Suid::FromFields(time, seq, host);
        ASSERT_TRUE(id.ok()) << id.status();
        EXPECT_EQ(id->Time(), time);
        EXPECT_EQ(id->Sequence(), seq);
        EXPECT_EQ(id->Host(), host);
        EXPECT_GE(id->ToRaw(), 0);

        auto back = Suid::FromText(id->ToText());
        ASSERT_TRUE(back.ok());
        EXPECT_EQ(*back, *id);
    }
}

TEST(SuidTest, FromTextRejectsMalformedInput) {
    EXPECT_EQ(Suid::FromText("").status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(Suid::FromText("111111111111").status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(Suid::FromText("11111111111111").status().code(), absl::StatusCode::kInvalidArgument);

    auto bad_char = Suid::FromText("11111111111A1");
    EXPECT_EQ(bad_char.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_THAT(std::string(bad_char.status().message()), HasSubstr("SUID"));
}

TEST(SuidTest, BinaryIsBigEndian) {
    auto id = Suid::FromFields(kTime, 5, 3);
    ASSERT_TRUE(id.ok());
    const auto bytes = id->ToBinary();
    EXPECT_EQ(bytes[7], 0x03);
    EXPECT_EQ(bytes[6], 0x05);

    auto back = Suid::FromBinary(bytes);
    ASSERT_TRUE(back.ok());
    EXPECT_EQ(*back, *id);

    std::array<uint8_t, 7> short_bytes{};
    EXPECT_EQ(Suid::FromBinary(short_bytes).status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(SuidTest, DecimalAndHexForms) {
    auto id = Suid::FromFields(kTime, 77, 200);
    ASSERT_TRUE(id.ok());

    auto from_dec = Suid::FromDecimal(id->ToDecimal());
    ASSERT_TRUE(from_dec.ok());
    EXPECT_EQ(*from_dec, *id);

    auto from_hex = Suid::FromHex(id->ToHex());
    ASSERT_TRUE(from_hex.ok());
    EXPECT_EQ(*from_hex, *id);

    EXPECT_FALSE(Suid::FromDecimal("12abc").ok());
    EXPECT_FALSE(Suid::FromHex("xyz").ok());
}

TEST(SuidTest, VerifyIsASanityCheck) {
    auto fresh = Suid::FromFields(Suid::kTimeFloor + 1, 0, 0);
    ASSERT_TRUE(fresh.ok());
    EXPECT_TRUE(fresh->Verify());

    auto at_floor = Suid::FromFields(Suid::kTimeFloor, 0, 0);
    ASSERT_TRUE(at_floor.ok());
    EXPECT_FALSE(at_floor->Verify());

    EXPECT_FALSE(Suid().Verify());
    // Reserved bit set
    EXPECT_FALSE(Suid::FromRaw(-1).Verify());
    EXPECT_EQ(Suid::FromRaw(-1).Reserved(), 1u);
}

TEST(SuidTest, OrderingFollowsValue) {
    auto earlier = Suid::FromFields(kTime, 4000, 9);
    auto later = Suid::FromFields(kTime + 1, 0, 0);
    ASSERT_TRUE(earlier.ok());
    ASSERT_TRUE(later.ok());
    EXPECT_LT(*earlier, *later);
    EXPECT_LT(earlier->ToText(), later->ToText());
    EXPECT_LT(earlier->ToRaw(), later->ToRaw());
    EXPECT_NE(*earlier, *later);
}

TEST(SuidTest, DescriptionAndStream) {
    auto id = Suid::FromFields(kTime, 5, 3);
    ASSERT_TRUE(id.ok());
    const std::string description = id->Description();
    EXPECT_THAT(description, HasSubstr("seq: 5"));
    EXPECT_THAT(description, HasSubstr("host: 3"));
    EXPECT_THAT(description, HasSubstr("2025-04-23T09:20:01"));

    std::ostringstream os;
    os << *id;
    EXPECT_EQ(os.str(), id->ToText());
}

}  // namespace
}  // namespace suid
