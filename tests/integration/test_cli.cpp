#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <regex>
#include <sstream>

#include <nlohmann/json.hpp>

#include "ironclad/cli/application.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

namespace ironclad::cli {

class CliTest : public ::testing::Test {
protected:
  void SetUp() override {
    temp_dir_ = std::make_unique<ironclad::test::TempDirectory>();

    // Keep the user's real config and logs out of the tests
    setenv("XDG_CONFIG_HOME", (temp_dir_->path() / "config").c_str(), 1);
    setenv("XDG_DATA_HOME", (temp_dir_->path() / "data").c_str(), 1);
  }

  void TearDown() override {
    unsetenv("XDG_CONFIG_HOME");
    unsetenv("XDG_DATA_HOME");
    temp_dir_.reset();
  }

  // Run one command on a fresh Application and capture stdout and stderr
  std::pair<int, std::string> runCommand(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>("ironclad"));
    argv.push_back(const_cast<char*>("--no-color"));
    for (const auto& arg : args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }

    std::ostringstream cout_output, cerr_output;
    std::streambuf* orig_cout = std::cout.rdbuf();
    std::streambuf* orig_cerr = std::cerr.rdbuf();
    std::cout.rdbuf(cout_output.rdbuf());
    std::cerr.rdbuf(cerr_output.rdbuf());

    int result = 0;
    try {
      Application app;
      result = app.run(static_cast<int>(argv.size()), argv.data());
    } catch (const std::exception&) {
      std::cout.rdbuf(orig_cout);
      std::cerr.rdbuf(orig_cerr);
      throw;
    }

    std::cout.rdbuf(orig_cout);
    std::cerr.rdbuf(orig_cerr);

    return {result, cout_output.str() + cerr_output.str()};
  }

  static std::string valueAfter(const std::string& output, const std::string& label) {
    auto pos = output.find(label);
    if (pos == std::string::npos) {
      return "";
    }
    auto start = pos + label.size();
    auto end = output.find('\n', start);
    return output.substr(start, end == std::string::npos ? std::string::npos : end - start);
  }

  std::filesystem::path path(const std::string& name) const { return temp_dir_->path() / name; }

  std::unique_ptr<ironclad::test::TempDirectory> temp_dir_;
};

TEST_F(CliTest, HashDefaultsToSha256Hex) {
  auto [code, output] = runCommand({"hash", "teststring"});
  EXPECT_EQ(code, 0);
  EXPECT_EQ(valueAfter(output, "Hashed string (sha256): "),
            "3c8727e019a42b444667a587b6001251becadabbb36bfed8087a92c18882d111");
}

TEST_F(CliTest, HashWithSha512) {
  auto [code, output] = runCommand({"hash", "teststring", "-a", "sha512"});
  EXPECT_EQ(code, 0);
  EXPECT_TRUE(std::regex_search(output, std::regex("Hashed string \\(sha512\\): [a-f0-9]{128}")))
      << output;
}

TEST_F(CliTest, HashWithoutTextFails) {
  auto [code, output] = runCommand({"hash"});
  EXPECT_NE(code, 0);
}

TEST_F(CliTest, HashWithUnknownAlgorithmReportsError) {
  auto [code, output] = runCommand({"hash", "teststring", "-a", "md5"});
  EXPECT_EQ(code, 1);
  EXPECT_NE(output.find("Error: Unsupported hashing algorithm: md5"), std::string::npos) << output;
}

TEST_F(CliTest, GenerateSalt) {
  auto [code, output] = runCommand({"generate-salt"});
  EXPECT_EQ(code, 0);
  EXPECT_TRUE(std::regex_search(output, std::regex("Generated Salt: [a-f0-9]{32}\n"))) << output;

  auto [code24, output24] = runCommand({"generate-salt", "-l", "24"});
  EXPECT_EQ(code24, 0);
  EXPECT_TRUE(std::regex_search(output24, std::regex("Generated Salt: [a-f0-9]{48}\n")))
      << output24;
}

TEST_F(CliTest, CompareMatchesOwnDigest) {
  auto [hash_code, hash_output] =
      runCommand({"hash", "test-comparison", "-a", "sha512", "-s", "pepper"});
  ASSERT_EQ(hash_code, 0);
  auto digest = valueAfter(hash_output, "Hashed string (sha512): ");
  ASSERT_FALSE(digest.empty());

  auto [code, output] =
      runCommand({"compare", "test-comparison", digest, "-a", "sha512", "-s", "pepper"});
  EXPECT_EQ(code, 0);
  EXPECT_EQ(output, "Match: true\n");
}

TEST_F(CliTest, CompareMismatch) {
  auto [code, output] = runCommand({"compare", "string1", "some-incorrect-hash"});
  EXPECT_EQ(code, 0);
  EXPECT_EQ(output, "Match: false\n");
}

TEST_F(CliTest, EqualsIsConstantTimeComparison) {
  EXPECT_EQ(runCommand({"equals", "abc", "abc"}).second, "Equal: true\n");
  EXPECT_EQ(runCommand({"equals", "abc", "abd"}).second, "Equal: false\n");
  EXPECT_EQ(runCommand({"equals", "abc", "abcd"}).second, "Equal: false\n");
}

TEST_F(CliTest, MaskWithDefaults) {
  auto [code, output] = runCommand({"mask", "1234-5678-9012-3456"});
  EXPECT_EQ(code, 0);
  EXPECT_EQ(output, "Masked string: 12***********56\n");
}

TEST_F(CliTest, MaskWithOptions) {
  auto [code, output] =
      runCommand({"mask", "1234-5678-9012-3456", "-s", "4", "-e", "4", "-l", "high", "-m", "#"});
  EXPECT_EQ(code, 0);
  EXPECT_EQ(output, "Masked string: 1234###########3456\n");
}

TEST_F(CliTest, MaskJsonOutput) {
  auto [code, output] = runCommand({"--json", "mask", "secret1234"});
  EXPECT_EQ(code, 0);
  auto json = nlohmann::json::parse(output);
  EXPECT_EQ(json["masked"], "se****34");
  EXPECT_EQ(json["sensitivity"], "medium");
}

TEST_F(CliTest, RandomWithCharset) {
  auto [code, output] = runCommand({"random", "-l", "20", "-c", "numeric"});
  EXPECT_EQ(code, 0);
  EXPECT_TRUE(std::regex_search(output, std::regex("Generated Random String: [0-9]{20}\n")))
      << output;
}

TEST_F(CliTest, RandomDefaultsToSixteenAlphanumeric) {
  auto [code, output] = runCommand({"random"});
  EXPECT_EQ(code, 0);
  EXPECT_TRUE(std::regex_search(output, std::regex("Generated Random String: [A-Za-z0-9]{16}\n")))
      << output;
}

TEST_F(CliTest, RedactFileToOutput) {
  auto input = temp_dir_->createFile(
      "test.txt", "My credit card is 1234-5678-9012-3456 and my email is test@example.com");
  auto output_path = path("test-redacted.txt");

  auto [code, output] = runCommand(
      {"redact", "-f", input.string(), "-o", output_path.string(), "-r",
       R"({"\\d{4}-\\d{4}-\\d{4}-\\d{4}": {"visibleStart": 4, "visibleEnd": 4},)"
       R"( "[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\\.[a-zA-Z]{2,}": {"sensitivity": "high"}})"});

  EXPECT_EQ(code, 0) << output;
  EXPECT_NE(output.find("Redacted content saved to: " + output_path.string()), std::string::npos)
      << output;
  EXPECT_EQ(ironclad::test::readFile(output_path),
            "My credit card is 1234********3456 and my email is te************om");
  EXPECT_EQ(ironclad::test::readFile(input),
            "My credit card is 1234-5678-9012-3456 and my email is test@example.com");
}

TEST_F(CliTest, RedactOverwritesByDefault) {
  auto input = temp_dir_->createFile("log.txt", "pin 1234\n");

  auto [code, output] =
      runCommand({"redact", "-f", input.string(), "-r",
                  R"({"\\d{4}": {"visibleEnd": 0, "sensitivity": "high"}})"});
  EXPECT_EQ(code, 0) << output;
  EXPECT_NE(output.find("Original file overwritten."), std::string::npos);
  EXPECT_EQ(ironclad::test::readFile(input), "pin 12**\n");
}

TEST_F(CliTest, RedactContinuesPastInvalidRule) {
  auto input = temp_dir_->createFile("log.txt", "pin 1234\n");

  auto [code, output] = runCommand(
      {"--json", "redact", "-f", input.string(), "-r",
       R"({"[unclosed": {}, "\\d{4}": {"visibleStart": 0, "visibleEnd": 0, "sensitivity": "high"}})"});
  EXPECT_EQ(code, 0) << output;
  EXPECT_EQ(ironclad::test::readFile(input), "pin ****\n");

  auto json = nlohmann::json::parse(output);
  ASSERT_EQ(json["rules"].size(), 2u);
  EXPECT_EQ(json["rules"][0]["code"], "Regex error");
  EXPECT_EQ(json["rules"][1]["matches"], 1);
}

TEST_F(CliTest, RedactHandlesHugeToken) {
  auto input = temp_dir_->createFile("blob.log", "key=" + std::string(500000, 'Z') + "\n");

  auto [code, output] =
      runCommand({"--json", "redact", "-f", input.string(), "-r",
                  R"({"key=[A-Z]+": {"visibleStart": 4, "visibleEnd": 0, "sensitivity": "high"}})"});
  EXPECT_EQ(code, 0);
  auto json = nlohmann::json::parse(output);
  EXPECT_EQ(json["matches"], 1);
  EXPECT_EQ(ironclad::test::readFile(input), "key=" + std::string(500000, '*') + "\n");
}

TEST_F(CliTest, RedactRulesFile) {
  auto input = temp_dir_->createFile("log.txt", "ssn 123-45-6789\n");
  auto rules = temp_dir_->createFile(
      "rules.json", R"({"\\d{3}-\\d{2}-\\d{4}": {"visibleStart": 0, "visibleEnd": 4, "sensitivity": "high"}})");

  auto [code, output] =
      runCommand({"redact", "-f", input.string(), "--rules-file", rules.string()});
  EXPECT_EQ(code, 0) << output;
  EXPECT_EQ(ironclad::test::readFile(input), "ssn *******6789\n");
}

TEST_F(CliTest, RedactUsesConfigRules) {
  auto config = temp_dir_->createFile("ironclad.toml", R"(
[[redact.rules]]
pattern = '\d{4}'
visible_start = 1
visible_end = 1
sensitivity = "high"
)");
  auto input = temp_dir_->createFile("log.txt", "pin 1234\n");

  auto [code, output] =
      runCommand({"--config", config.string(), "redact", "-f", input.string()});
  EXPECT_EQ(code, 0) << output;
  EXPECT_EQ(ironclad::test::readFile(input), "pin 1**4\n");
}

TEST_F(CliTest, RedactWithoutRulesFails) {
  auto input = temp_dir_->createFile("log.txt", "pin 1234\n");
  auto [code, output] = runCommand({"redact", "-f", input.string()});
  EXPECT_EQ(code, 1);
  EXPECT_NE(output.find("No redaction rules"), std::string::npos) << output;
  EXPECT_EQ(ironclad::test::readFile(input), "pin 1234\n");
}

TEST_F(CliTest, RedactInvalidRulesJson) {
  auto input = temp_dir_->createFile("log.txt", "pin 1234\n");
  auto [code, output] = runCommand({"redact", "-f", input.string(), "-r", "{oops"});
  EXPECT_EQ(code, 1);
  EXPECT_NE(output.find("Invalid rules JSON"), std::string::npos) << output;
}

TEST_F(CliTest, RedactMissingFile) {
  auto [code, output] =
      runCommand({"redact", "-f", path("missing.txt").string(), "-r", R"({"a": {}})"});
  EXPECT_EQ(code, 1);
  EXPECT_NE(output.find("File not found"), std::string::npos) << output;
}

TEST_F(CliTest, RedactRequiresFile) {
  auto [code, output] = runCommand({"redact", "-r", R"({"a": {}})"});
  EXPECT_NE(code, 0);
}

TEST_F(CliTest, BloomCreateAddCheck) {
  auto filter = path("seen.json").string();

  auto [create_code, create_output] =
      runCommand({"bloom", "create", "--filter", filter, "--size", "100", "--seeds", "1,7"});
  ASSERT_EQ(create_code, 0) << create_output;

  auto [add_code, add_output] =
      runCommand({"bloom", "add", "--filter", filter, "apple", "banana", "cherry"});
  ASSERT_EQ(add_code, 0) << add_output;

  auto [check_code, check_output] =
      runCommand({"bloom", "check", "--filter", filter, "apple", "grape"});
  EXPECT_EQ(check_code, 0);
  EXPECT_EQ(check_output, "apple: possibly present\ngrape: definitely absent\n");
}

TEST_F(CliTest, BloomCheckMissingFilterFails) {
  auto [code, output] = runCommand({"bloom", "check", "--filter", path("none.json").string(), "x"});
  EXPECT_EQ(code, 1);
}

TEST_F(CliTest, ConfigInitGetSetValidate) {
  auto config = path("cfg/config.toml").string();

  auto [init_code, init_output] = runCommand({"config", "init", config});
  ASSERT_EQ(init_code, 0) << init_output;
  EXPECT_TRUE(std::filesystem::exists(config));

  auto [again_code, again_output] = runCommand({"config", "init", config});
  EXPECT_EQ(again_code, 1);

  auto [set_code, set_output] =
      runCommand({"--config", config, "config", "set", "mask.visible_start", "4"});
  ASSERT_EQ(set_code, 0) << set_output;

  auto [get_code, get_output] =
      runCommand({"--config", config, "config", "get", "mask.visible_start"});
  EXPECT_EQ(get_code, 0);
  EXPECT_EQ(get_output, "4\n");

  auto [mask_code, mask_output] = runCommand({"--config", config, "mask", "password123"});
  EXPECT_EQ(mask_output, "Masked string: pass****23\n");

  auto [validate_code, validate_output] = runCommand({"--config", config, "config", "validate"});
  EXPECT_EQ(validate_code, 0) << validate_output;
}

TEST_F(CliTest, ConfigSetRejectsInvalidValue) {
  auto config = path("config.toml").string();
  ASSERT_EQ(runCommand({"config", "init", config}).first, 0);

  auto [code, output] =
      runCommand({"--config", config, "config", "set", "digest.algorithm", "md5"});
  EXPECT_EQ(code, 1);

  auto [get_code, get_output] =
      runCommand({"--config", config, "config", "get", "digest.algorithm"});
  EXPECT_EQ(get_output, "sha256\n");
}

TEST_F(CliTest, ConfigDefaultsFeedCommands) {
  auto config = temp_dir_->createFile("ironclad.toml", R"(
[digest]
algorithm = "sha512"

[random]
length = 8
charset = "hex"
)");

  auto [hash_code, hash_output] = runCommand({"--config", config.string(), "hash", "x"});
  EXPECT_NE(hash_output.find("Hashed string (sha512): "), std::string::npos) << hash_output;

  auto [random_code, random_output] = runCommand({"--config", config.string(), "random"});
  EXPECT_TRUE(std::regex_search(random_output,
                                std::regex("Generated Random String: [0-9a-f]{8}\n")))
      << random_output;
}

TEST_F(CliTest, MissingExplicitConfigFails) {
  auto [code, output] = runCommand({"--config", path("absent.toml").string(), "mask", "abc"});
  EXPECT_EQ(code, 1);
  EXPECT_NE(output.find("Config file not found"), std::string::npos) << output;
}

TEST_F(CliTest, JsonErrorOutput) {
  auto [code, output] = runCommand({"--json", "hash", "x", "-a", "md5"});
  EXPECT_EQ(code, 1);
  auto json = nlohmann::json::parse(output);
  EXPECT_EQ(json["error"], true);
  EXPECT_EQ(json["kind"], "Unsupported algorithm");
}

TEST_F(CliTest, RequiresSubcommand) {
  auto [code, output] = runCommand({});
  EXPECT_NE(code, 0);
}

}  // namespace ironclad::cli
