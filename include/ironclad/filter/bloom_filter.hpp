#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "ironclad/common.hpp"

namespace ironclad::filter {

inline constexpr size_t kDefaultBloomSize = 100;

/**
 * @brief Fixed-size probabilistic set membership
 *
 * check() answers "possibly present" (true) or "definitely absent" (false).
 * False negatives cannot happen while the size, seeds and bits are unchanged
 * since the item was added. A filter without seeds reports every item as
 * possibly present. Not internally synchronized.
 */
class BloomFilter {
public:
  /**
   * @brief Create an empty filter
   * @param size Number of bits, must be positive
   * @param seeds One hash function per seed
   */
  static Result<BloomFilter> create(size_t size = kDefaultBloomSize,
                                    std::vector<int32_t> seeds = {});

  void add(std::string_view item);
  bool check(std::string_view item) const;

  size_t size() const { return size_; }
  const std::vector<int32_t>& seeds() const { return seeds_; }

  // Number of bits currently set
  size_t popcount() const;

  // Bit index for item under one seed
  size_t indexFor(std::string_view item, int32_t seed) const;

  // {"size": N, "seeds": [...], "bits": "<hex>"}
  nlohmann::json toJson() const;
  static Result<BloomFilter> fromJson(const nlohmann::json& json);

private:
  BloomFilter(size_t size, std::vector<int32_t> seeds);

  void setBit(size_t index);
  bool testBit(size_t index) const;

  size_t size_;
  std::vector<int32_t> seeds_;
  std::vector<uint8_t> bits_;
};

}  // namespace ironclad::filter
