#include "ironclad/cli/commands/mask_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "ironclad/core/masker.hpp"

namespace ironclad::cli {

MaskCommand::MaskCommand(Application& app) : app_(app) {
}

void MaskCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("text", text_, "String to mask")->required();
  start_option_ = cmd->add_option("-s,--visible-start", visible_start_,
                                  "Characters left visible at the start (default: 2)");
  end_option_ = cmd->add_option("-e,--visible-end", visible_end_,
                                "Characters left visible at the end (default: 2)");
  cmd->add_option("-l,--sensitivity", sensitivity_,
                  "Sensitivity level (low, medium, high, default: medium)");
  cmd->add_option("-m,--mask-char", mask_char_, "Mask character (default: *)");
}

Result<int> MaskCommand::execute(const GlobalOptions& options) {
  auto config = app_.config().maskDefaults();

  if (start_option_->count() > 0) {
    config.withVisibleStart(visible_start_);
  }
  if (end_option_->count() > 0) {
    config.withVisibleEnd(visible_end_);
  }
  if (!sensitivity_.empty()) {
    config.withSensitivity(core::parseSensitivity(sensitivity_));
  }
  if (!mask_char_.empty()) {
    config.withMaskChar(mask_char_);
  }

  std::string masked = core::mask(text_, config);

  if (options.json) {
    nlohmann::json result;
    result["masked"] = masked;
    result["visible_start"] = config.visible_start;
    result["visible_end"] = config.visible_end;
    result["sensitivity"] = core::sensitivityToString(config.sensitivity);
    std::cout << result.dump(2) << std::endl;
  } else {
    std::cout << "Masked string: " << masked << std::endl;
  }

  return 0;
}

} // namespace ironclad::cli
