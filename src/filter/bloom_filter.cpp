#include "ironclad/filter/bloom_filter.hpp"

#include <bit>

#include "ironclad/crypto/encoding.hpp"

namespace ironclad::filter {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

BloomFilter::BloomFilter(size_t size, std::vector<int32_t> seeds)
    : size_(size), seeds_(std::move(seeds)), bits_((size + 7) / 8, 0) {}

Result<BloomFilter> BloomFilter::create(size_t size, std::vector<int32_t> seeds) {
  if (size == 0) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Bloom filter size must be positive"));
  }
  return BloomFilter(size, std::move(seeds));
}

size_t BloomFilter::indexFor(std::string_view item, int32_t seed) const {
  // h = h * 31 + c with 32-bit two's complement wrap-around
  uint32_t hash = static_cast<uint32_t>(seed);
  for (unsigned char c : item) {
    hash = (hash << 5) - hash + c;
  }
  int64_t signed_hash = static_cast<int32_t>(hash);
  uint64_t magnitude = static_cast<uint64_t>(signed_hash < 0 ? -signed_hash : signed_hash);
  return static_cast<size_t>(magnitude % size_);
}

void BloomFilter::add(std::string_view item) {
  for (int32_t seed : seeds_) {
    setBit(indexFor(item, seed));
  }
}

bool BloomFilter::check(std::string_view item) const {
  for (int32_t seed : seeds_) {
    if (!testBit(indexFor(item, seed))) {
      return false;
    }
  }
  return true;  // May be a false positive
}

size_t BloomFilter::popcount() const {
  size_t count = 0;
  for (uint8_t byte : bits_) {
    count += static_cast<size_t>(std::popcount(byte));
  }
  return count;
}

void BloomFilter::setBit(size_t index) {
  bits_[index / 8] |= static_cast<uint8_t>(1u << (index % 8));
}

bool BloomFilter::testBit(size_t index) const {
  return (bits_[index / 8] >> (index % 8)) & 1u;
}

nlohmann::json BloomFilter::toJson() const {
  nlohmann::json json;
  json["size"] = size_;
  json["seeds"] = seeds_;
  json["bits"] = crypto::toHex(bits_);
  return json;
}

Result<BloomFilter> BloomFilter::fromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return std::unexpected(makeError(ErrorCode::kParseError, "Bloom filter must be a JSON object"));
  }

  try {
    auto size = json.at("size").get<size_t>();
    auto seeds = json.value("seeds", std::vector<int32_t>{});

    auto filter = create(size, std::move(seeds));
    if (!filter.has_value()) {
      return filter;
    }

    auto bits = json.value("bits", std::string{});
    if (bits.empty()) {
      return filter;
    }
    if (bits.size() != filter->bits_.size() * 2) {
      return std::unexpected(makeError(ErrorCode::kParseError,
                                       "Bloom filter bit array does not match its size"));
    }

    for (size_t i = 0; i < filter->bits_.size(); ++i) {
      int high = hexValue(bits[2 * i]);
      int low = hexValue(bits[2 * i + 1]);
      if (high < 0 || low < 0) {
        return std::unexpected(makeError(ErrorCode::kParseError,
                                         "Bloom filter bit array is not hex"));
      }
      filter->bits_[i] = static_cast<uint8_t>((high << 4) | low);
    }
    return filter;
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid bloom filter JSON: " + std::string(e.what())));
  }
}

}  // namespace ironclad::filter
