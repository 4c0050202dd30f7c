#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "ironclad/core/mask_config.hpp"

namespace ironclad::core {

/**
 * @brief Mask the middle of a string, keeping a visible prefix and suffix
 *
 * Lengths are counted in UTF-8 code points. When
 * visible_start + visible_end >= length the input is returned unchanged.
 * Otherwise round(hidden * ratio) characters of mask are emitted between the
 * prefix and suffix and the rest of the hidden span is dropped, so the result
 * may be shorter than the input.
 *
 * @param input Text to mask
 * @param config Visibility, sensitivity and mask generator
 * @return Masked text
 */
std::string mask(std::string_view input, const MaskConfig& config = {});

/**
 * @brief Number of mask characters emitted for a hidden span
 */
size_t maskedLength(size_t hidden_span, Sensitivity sensitivity);

/**
 * @brief Number of UTF-8 code points in text (stray bytes count as one each)
 */
size_t characterCount(std::string_view text);

}  // namespace ironclad::core
