#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace ironclad::crypto {

// Lowercase hexadecimal, two characters per byte
std::string toHex(std::span<const uint8_t> bytes);

// Standard base64 with padding (RFC 4648)
std::string toBase64(std::span<const uint8_t> bytes);

}  // namespace ironclad::crypto
