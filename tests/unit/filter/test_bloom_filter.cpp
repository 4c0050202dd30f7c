#include <gtest/gtest.h>

#include <optional>

#include "ironclad/filter/bloom_filter.hpp"
#include "test_helpers.hpp"

using namespace ironclad::filter;
using ironclad::ErrorCode;

class BloomFilterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto created = BloomFilter::create(100, {1, 7});
    ASSERT_TRUE(created.has_value());
    filter_.emplace(std::move(*created));
  }

  std::optional<BloomFilter> filter_;
};

TEST_F(BloomFilterTest, AddedItemsArePossiblyPresent) {
  filter_->add("apple");
  filter_->add("banana");
  filter_->add("cherry");

  EXPECT_TRUE(filter_->check("apple"));
  EXPECT_TRUE(filter_->check("banana"));
  EXPECT_TRUE(filter_->check("cherry"));
}

TEST_F(BloomFilterTest, ItemsWithUnsetBitsAreDefinitelyAbsent) {
  filter_->add("apple");
  filter_->add("banana");
  filter_->add("cherry");

  EXPECT_FALSE(filter_->check("grape"));
  EXPECT_FALSE(filter_->check("kiwi"));
}

TEST_F(BloomFilterTest, IndicesAreDeterministic) {
  EXPECT_EQ(filter_->indexFor("apple", 1), 61u);
  EXPECT_EQ(filter_->indexFor("apple", 7), 67u);
  EXPECT_EQ(filter_->indexFor("banana", 1), 46u);
  EXPECT_EQ(filter_->indexFor("banana", 7), 44u);
  EXPECT_EQ(filter_->indexFor("cherry", 7), 8u);
  EXPECT_EQ(filter_->indexFor("", 7), 7u);
}

TEST_F(BloomFilterTest, EmptyFilterReportsAbsent) {
  EXPECT_FALSE(filter_->check("apple"));
  EXPECT_EQ(filter_->popcount(), 0u);
}

TEST_F(BloomFilterTest, PopcountCountsDistinctBits) {
  filter_->add("apple");
  EXPECT_EQ(filter_->popcount(), 2u);
  filter_->add("apple");
  EXPECT_EQ(filter_->popcount(), 2u);
}

TEST_F(BloomFilterTest, NoFalseNegativesOverManyItems) {
  auto big = BloomFilter::create(4096, {3, 11, 29});
  ASSERT_OK(big);
  for (int i = 0; i < 500; ++i) {
    big->add("item-" + std::to_string(i));
  }
  for (int i = 0; i < 500; ++i) {
    EXPECT_TRUE(big->check("item-" + std::to_string(i))) << i;
  }
}

TEST_F(BloomFilterTest, JsonRoundTripKeepsState) {
  filter_->add("apple");
  filter_->add("banana");

  auto json = filter_->toJson();
  EXPECT_EQ(json["size"], 100);
  EXPECT_EQ(json["seeds"], nlohmann::json({1, 7}));
  EXPECT_EQ(json["bits"].get<std::string>().size(), 26u);

  auto restored = BloomFilter::fromJson(json);
  ASSERT_OK(restored);
  EXPECT_TRUE(restored->check("apple"));
  EXPECT_TRUE(restored->check("banana"));
  EXPECT_FALSE(restored->check("grape"));
  EXPECT_EQ(restored->popcount(), filter_->popcount());
}

TEST(BloomFilterCreateTest, ZeroSizeIsInvalid) {
  EXPECT_ERROR(BloomFilter::create(0, {1}), ErrorCode::kInvalidArgument);
}

TEST(BloomFilterCreateTest, NoSeedsMeansEverythingPossiblyPresent) {
  auto filter = BloomFilter::create();
  ASSERT_OK(filter);
  EXPECT_EQ(filter->size(), kDefaultBloomSize);
  EXPECT_TRUE(filter->check("anything"));
}

TEST(BloomFilterCreateTest, FromJsonRejectsBadInput) {
  EXPECT_ERROR(BloomFilter::fromJson(nlohmann::json::array()), ErrorCode::kParseError);
  EXPECT_ERROR(BloomFilter::fromJson(nlohmann::json{{"seeds", {1}}}), ErrorCode::kParseError);
  EXPECT_ERROR(BloomFilter::fromJson(nlohmann::json{{"size", 8}, {"bits", "zz"}}),
               ErrorCode::kParseError);
  EXPECT_ERROR(BloomFilter::fromJson(nlohmann::json{{"size", 8}, {"bits", "0000"}}),
               ErrorCode::kParseError);
  EXPECT_ERROR(BloomFilter::fromJson(nlohmann::json{{"size", 0}}), ErrorCode::kInvalidArgument);
}
