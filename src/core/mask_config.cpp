#include "ironclad/core/mask_config.hpp"

namespace ironclad::core {

double sensitivityRatio(Sensitivity sensitivity) {
  switch (sensitivity) {
    case Sensitivity::kLow:
      return 0.3;
    case Sensitivity::kMedium:
      return 0.7;
    case Sensitivity::kHigh:
      return 1.0;
  }
  return 0.7;
}

Sensitivity parseSensitivity(std::string_view name) {
  if (name == "low") return Sensitivity::kLow;
  if (name == "high") return Sensitivity::kHigh;
  return Sensitivity::kMedium;
}

std::string sensitivityToString(Sensitivity sensitivity) {
  switch (sensitivity) {
    case Sensitivity::kLow: return "low";
    case Sensitivity::kMedium: return "medium";
    case Sensitivity::kHigh: return "high";
  }
  return "medium";
}

RepeatMaskGenerator::RepeatMaskGenerator(std::string literal) : literal_(std::move(literal)) {}

std::string RepeatMaskGenerator::generate(size_t length) const {
  if (literal_.size() == 1) {
    return std::string(length, literal_.front());
  }

  std::string result;
  result.reserve(literal_.size() * length);
  for (size_t i = 0; i < length; ++i) {
    result += literal_;
  }
  return result;
}

FunctionMaskGenerator::FunctionMaskGenerator(Function fn, std::string description)
    : fn_(std::move(fn)), description_(std::move(description)) {}

std::string FunctionMaskGenerator::generate(size_t length) const {
  return fn_ ? fn_(length) : std::string();
}

MaskConfig& MaskConfig::withMaskChar(std::string literal) {
  mask = std::make_shared<RepeatMaskGenerator>(std::move(literal));
  return *this;
}

MaskConfig& MaskConfig::withGenerator(std::shared_ptr<const MaskGenerator> generator) {
  mask = generator ? std::move(generator) : defaultGenerator();
  return *this;
}

std::shared_ptr<const MaskGenerator> MaskConfig::defaultGenerator() {
  static const auto generator =
      std::make_shared<const RepeatMaskGenerator>(std::string(kDefaultMaskChar));
  return generator;
}

}  // namespace ironclad::core
