// ============================================================================
// Result Type Tests
// ============================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "pactum/core/result.hpp"

using namespace pactum;

namespace {

Result<int> ParseFee(const std::string& text) {
    if (text.empty()) return Err(Errc::InvalidInput);
    return Ok(std::stoi(text));
}

}  // namespace

TEST(ResultTest, OkConstruction) {
    Result<int> result = Ok(42);

    EXPECT_TRUE(result.IsOk());
    EXPECT_FALSE(result.IsErr());
    EXPECT_EQ(result.Value(), 42);
}

TEST(ResultTest, ErrFromErrc) {
    Result<int> result = Err(Errc::NotFound);

    EXPECT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error(), Errc::NotFound);
    EXPECT_EQ(result.Error().category().name(), std::string("pactum"));
}

TEST(ResultTest, CustomErrorType) {
    Result<int, std::string> result = Err(std::string("boom"));
    EXPECT_EQ(result.Error(), "boom");
}

TEST(ResultTest, BoolConversion) {
    EXPECT_TRUE(static_cast<bool>(ParseFee("5")));
    EXPECT_FALSE(static_cast<bool>(ParseFee("")));
}

TEST(ResultTest, ValueOr) {
    EXPECT_EQ(ParseFee("7").ValueOr(0), 7);
    EXPECT_EQ(ParseFee("").ValueOr(3), 3);
}

TEST(ResultTest, MapKeepsError) {
    auto doubled = ParseFee("").Map([](int x) { return x * 2; });
    ASSERT_TRUE(doubled.IsErr());
    EXPECT_EQ(doubled.Error(), Errc::InvalidInput);

    auto ok = ParseFee("4").Map([](int x) { return x * 2; });
    ASSERT_TRUE(ok.IsOk());
    EXPECT_EQ(ok.Value(), 8);
}

TEST(ResultTest, AndThen) {
    auto capped = [](int fee) -> Result<int> {
        if (fee > 10) return Err(Errc::InvalidInput);
        return Ok(fee);
    };

    auto good = ParseFee("9").AndThen(capped);
    auto too_big = ParseFee("11").AndThen(capped);
    auto empty = ParseFee("").AndThen(capped);

    EXPECT_EQ(good.Value(), 9);
    EXPECT_EQ(too_big.Error(), Errc::InvalidInput);
    EXPECT_EQ(empty.Error(), Errc::InvalidInput);
}

TEST(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>> result = Ok(std::make_unique<int>(5));
    ASSERT_TRUE(result.IsOk());

    std::unique_ptr<int> owned = std::move(result).Value();
    EXPECT_EQ(*owned, 5);
}

TEST(ResultTest, VoidOk) {
    Result<void> result = Ok();

    EXPECT_TRUE(result.IsOk());
    EXPECT_FALSE(result.IsErr());
}

TEST(ResultTest, VoidErr) {
    Result<void> result = Err(Errc::Unauthorized);

    EXPECT_TRUE(result.IsErr());
    EXPECT_EQ(result.Error(), Errc::Unauthorized);
}
