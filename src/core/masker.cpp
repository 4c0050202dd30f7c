#include "ironclad/core/masker.hpp"

#include <cmath>

namespace ironclad::core {

namespace {

bool isContinuationByte(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

// Byte offset where the character with the given index starts
size_t byteOffsetOf(std::string_view text, size_t char_index) {
  size_t seen = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if (isContinuationByte(static_cast<unsigned char>(text[i])) && i != 0) {
      continue;
    }
    if (seen == char_index) {
      return i;
    }
    ++seen;
  }
  return text.size();
}

}  // namespace

size_t characterCount(std::string_view text) {
  size_t count = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if (i == 0 || !isContinuationByte(static_cast<unsigned char>(text[i]))) {
      ++count;
    }
  }
  return count;
}

size_t maskedLength(size_t hidden_span, Sensitivity sensitivity) {
  // Round half up, matching the reference table values exactly
  double scaled = static_cast<double>(hidden_span) * sensitivityRatio(sensitivity);
  return static_cast<size_t>(std::floor(scaled + 0.5));
}

std::string mask(std::string_view input, const MaskConfig& config) {
  const size_t length = characterCount(input);

  if (config.visible_start >= length || config.visible_end >= length ||
      config.visible_start + config.visible_end >= length) {
    return std::string(input);
  }

  const size_t hidden_span = length - config.visible_start - config.visible_end;
  const size_t masked = maskedLength(hidden_span, config.sensitivity);

  const auto& generator = config.mask ? config.mask : MaskConfig::defaultGenerator();
  std::string masked_part = generator->generate(masked);

  const size_t prefix_end = byteOffsetOf(input, config.visible_start);
  const size_t suffix_begin = byteOffsetOf(input, length - config.visible_end);

  std::string result;
  result.reserve(prefix_end + masked_part.size() + (input.size() - suffix_begin));
  result.append(input.substr(0, prefix_end));
  result.append(masked_part);
  result.append(input.substr(suffix_begin));
  return result;
}

}  // namespace ironclad::core
