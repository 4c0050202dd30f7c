#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include "ironclad/cli/application.hpp"
#include "ironclad/filter/bloom_filter.hpp"

namespace ironclad::cli {

/**
 * Command for a bloom filter persisted as JSON
 *
 * Subcommands:
 * - create: write an empty filter (--size, --seeds)
 * - add <items...>: insert items and save
 * - check <items...>: report "possibly present" or "definitely absent"
 */
class BloomCommand : public Command {
public:
  explicit BloomCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return "bloom"; }
  std::string description() const override { return "Create and query a bloom filter file"; }

private:
  bool create_mode_ = false;
  bool add_mode_ = false;
  bool check_mode_ = false;

  std::string filter_path_;
  size_t size_ = filter::kDefaultBloomSize;
  std::vector<int32_t> seeds_ = {1, 7};
  std::vector<std::string> items_;

  Result<int> executeCreate(const GlobalOptions& options);
  Result<int> executeAdd(const GlobalOptions& options);
  Result<int> executeCheck(const GlobalOptions& options);

  Result<filter::BloomFilter> loadFilter() const;
  Result<void> saveFilter(const filter::BloomFilter& filter) const;
};

} // namespace ironclad::cli
