#include "test_helpers.hpp"

#include <fstream>
#include <random>
#include <sstream>

namespace ironclad::test {

void TempDirTest::SetUp() {
  temp_dir_ = std::filesystem::temp_directory_path() / "ironclad_test";
  temp_dir_ /= randomString(8);
  std::filesystem::create_directories(temp_dir_);
}

void TempDirTest::TearDown() {
  std::error_code ec;
  if (std::filesystem::exists(temp_dir_, ec)) {
    std::filesystem::remove_all(temp_dir_, ec);
  }
}

std::string readFile(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return "";
  }
  std::ostringstream content;
  content << file.rdbuf();
  return content.str();
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file << content;
}

std::string randomString(size_t length) {
  static const char charset[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, sizeof(charset) - 2);

  std::string result;
  result.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    result += charset[dis(gen)];
  }
  return result;
}

std::string sampleLogText(size_t lines) {
  std::string text;
  for (size_t i = 0; i < lines; ++i) {
    text += "2024-01-01T00:00:" + std::to_string(i % 60) + " request " + std::to_string(i);
    if (i % 3 == 0) {
      text += " card=4111-1111-1111-" + std::to_string(1000 + i % 9000);
    }
    if (i % 5 == 0) {
      text += " user=user" + std::to_string(i) + "@example.com";
    }
    text += " status=ok\n";
  }
  return text;
}

}  // namespace ironclad::test
