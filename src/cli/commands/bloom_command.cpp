#include "ironclad/cli/commands/bloom_command.hpp"

#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ironclad/util/filesystem.hpp"

namespace ironclad::cli {

BloomCommand::BloomCommand(Application& /*app*/) {}

void BloomCommand::setupCommand(CLI::App* cmd) {
  auto create_cmd = cmd->add_subcommand("create", "Create an empty filter file");
  create_cmd->add_option("--filter", filter_path_, "Filter file (JSON)")->required();
  create_cmd->add_option("--size", size_, "Number of bits (default: 100)")
      ->check(CLI::PositiveNumber);
  create_cmd->add_option("--seeds", seeds_, "Hash seeds (default: 1,7)")->delimiter(',');
  create_cmd->callback([this]() { create_mode_ = true; });

  auto add_cmd = cmd->add_subcommand("add", "Add items to a filter");
  add_cmd->add_option("--filter", filter_path_, "Filter file (JSON)")->required();
  add_cmd->add_option("items", items_, "Items to add")->required();
  add_cmd->callback([this]() { add_mode_ = true; });

  auto check_cmd = cmd->add_subcommand("check", "Check whether items may be in a filter");
  check_cmd->add_option("--filter", filter_path_, "Filter file (JSON)")->required();
  check_cmd->add_option("items", items_, "Items to check")->required();
  check_cmd->callback([this]() { check_mode_ = true; });

  cmd->require_subcommand(1);
}

Result<int> BloomCommand::execute(const GlobalOptions& options) {
  if (create_mode_) {
    return executeCreate(options);
  } else if (add_mode_) {
    return executeAdd(options);
  } else if (check_mode_) {
    return executeCheck(options);
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> BloomCommand::executeCreate(const GlobalOptions& options) {
  auto filter = filter::BloomFilter::create(size_, seeds_);
  if (!filter.has_value()) {
    return std::unexpected(filter.error());
  }

  auto save_result = saveFilter(*filter);
  if (!save_result.has_value()) {
    return std::unexpected(save_result.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["success"] = true;
    output["filter"] = filter_path_;
    output["size"] = filter->size();
    output["seeds"] = filter->seeds();
    std::cout << output.dump(2) << "\n";
  } else if (!options.quiet) {
    std::cout << "Created bloom filter " << filter_path_ << " (" << filter->size() << " bits, "
              << filter->seeds().size() << " seeds)\n";
  }
  return 0;
}

Result<int> BloomCommand::executeAdd(const GlobalOptions& options) {
  auto filter = loadFilter();
  if (!filter.has_value()) {
    return std::unexpected(filter.error());
  }

  for (const auto& item : items_) {
    filter->add(item);
  }

  auto save_result = saveFilter(*filter);
  if (!save_result.has_value()) {
    return std::unexpected(save_result.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["success"] = true;
    output["filter"] = filter_path_;
    output["added"] = items_.size();
    output["bits_set"] = filter->popcount();
    std::cout << output.dump(2) << "\n";
  } else if (!options.quiet) {
    std::cout << "Added " << items_.size() << " item(s) to " << filter_path_ << "\n";
  }
  return 0;
}

Result<int> BloomCommand::executeCheck(const GlobalOptions& options) {
  auto filter = loadFilter();
  if (!filter.has_value()) {
    return std::unexpected(filter.error());
  }

  if (options.json) {
    auto results = nlohmann::json::array();
    for (const auto& item : items_) {
      nlohmann::json entry;
      entry["item"] = item;
      entry["possibly_present"] = filter->check(item);
      results.push_back(std::move(entry));
    }
    nlohmann::json output;
    output["filter"] = filter_path_;
    output["results"] = std::move(results);
    std::cout << output.dump(2) << "\n";
    return 0;
  }

  for (const auto& item : items_) {
    std::cout << item << ": " << (filter->check(item) ? "possibly present" : "definitely absent")
              << "\n";
  }
  return 0;
}

Result<filter::BloomFilter> BloomCommand::loadFilter() const {
  auto content = util::FileSystem::readFile(filter_path_);
  if (!content.has_value()) {
    return std::unexpected(content.error());
  }

  auto json = nlohmann::json::parse(*content, nullptr, false);
  if (json.is_discarded()) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Filter file is not valid JSON: " + filter_path_));
  }

  spdlog::debug("Loaded bloom filter from {}", filter_path_);
  return filter::BloomFilter::fromJson(json);
}

Result<void> BloomCommand::saveFilter(const filter::BloomFilter& filter) const {
  return util::FileSystem::writeFileAtomic(filter_path_, filter.toJson().dump(2) + "\n");
}

} // namespace ironclad::cli
