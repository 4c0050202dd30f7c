#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace ironclad::core {

/**
 * @brief How much of the hidden span is actually replaced by mask output
 */
enum class Sensitivity {
  kLow,     // 30% of the hidden span
  kMedium,  // 70% of the hidden span
  kHigh     // the whole hidden span
};

/**
 * @brief Fraction of the hidden span that is masked for a sensitivity level
 */
double sensitivityRatio(Sensitivity sensitivity);

/**
 * @brief Parse a sensitivity name ("low", "medium", "high")
 *
 * Unrecognized names fall back to Sensitivity::kMedium.
 */
Sensitivity parseSensitivity(std::string_view name);

std::string sensitivityToString(Sensitivity sensitivity);

/**
 * @brief Produces the replacement text for a masked span
 */
class MaskGenerator {
public:
  virtual ~MaskGenerator() = default;

  /**
   * @brief Generate the mask for a span of the given length
   * @param length Number of characters the caller wants masked
   * @return Replacement text; used verbatim even if its length differs
   */
  virtual std::string generate(size_t length) const = 0;

  /**
   * @brief Short human readable description, shown in the redactor's debug log
   */
  virtual std::string describe() const = 0;
};

// Repeats a literal (one or more characters) length times
class RepeatMaskGenerator : public MaskGenerator {
public:
  explicit RepeatMaskGenerator(std::string literal);

  std::string generate(size_t length) const override;
  std::string describe() const override { return literal_; }

  const std::string& literal() const { return literal_; }

private:
  std::string literal_;
};

// Adapts a callable to the MaskGenerator interface
class FunctionMaskGenerator : public MaskGenerator {
public:
  using Function = std::function<std::string(size_t)>;

  explicit FunctionMaskGenerator(Function fn, std::string description = "<function>");

  std::string generate(size_t length) const override;
  std::string describe() const override { return description_; }

private:
  Function fn_;
  std::string description_;
};

inline constexpr size_t kDefaultVisibleStart = 2;
inline constexpr size_t kDefaultVisibleEnd = 2;
inline constexpr std::string_view kDefaultMaskChar = "*";

/**
 * @brief Configuration describing how a single string is masked
 *
 * Immutable once built; the generator is shared, never mutated.
 */
struct MaskConfig {
  size_t visible_start = kDefaultVisibleStart;
  size_t visible_end = kDefaultVisibleEnd;
  std::shared_ptr<const MaskGenerator> mask = defaultGenerator();
  Sensitivity sensitivity = Sensitivity::kMedium;

  MaskConfig& withVisibleStart(size_t value) {
    visible_start = value;
    return *this;
  }

  MaskConfig& withVisibleEnd(size_t value) {
    visible_end = value;
    return *this;
  }

  MaskConfig& withMaskChar(std::string literal);

  MaskConfig& withGenerator(std::shared_ptr<const MaskGenerator> generator);

  MaskConfig& withSensitivity(Sensitivity value) {
    sensitivity = value;
    return *this;
  }

  // Shared "*" generator used by default-constructed configs
  static std::shared_ptr<const MaskGenerator> defaultGenerator();
};

}  // namespace ironclad::core
