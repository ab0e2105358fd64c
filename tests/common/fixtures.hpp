#ifndef CHRONOSNAP_TESTS_COMMON_FIXTURES_HPP_
#define CHRONOSNAP_TESTS_COMMON_FIXTURES_HPP_

#include "assertions.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace chronosnap::tests::common {

inline void WriteFixtureFile(const std::filesystem::path& file_path, std::string_view content) {
  std::error_code ec;
  if (!file_path.parent_path().empty()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      Fail("failed to create fixture directory: " + file_path.parent_path().string());
    }
  }

  std::ofstream output(file_path, std::ios::binary | std::ios::trunc);
  if (!output) {
    Fail("failed to open fixture file for writing: " + file_path.string());
  }

  output << content;
  if (!output) {
    Fail("failed while writing fixture file: " + file_path.string());
  }
}

// Sets an environment variable for the lifetime of the guard and restores the
// previous value (or absence) afterwards.
class ScopedEnvOverride {
public:
  ScopedEnvOverride(const char* name, const char* value)
      : name_(name), previous_(ReadEnvVar(name)) {
    if (setenv(name_, value, 1) != 0) {
      Fail("failed to set environment variable");
    }
  }

  ~ScopedEnvOverride() {
    if (previous_.has_value()) {
      (void)setenv(name_, previous_->c_str(), 1);
      return;
    }
    (void)unsetenv(name_);
  }

  ScopedEnvOverride(const ScopedEnvOverride&) = delete;
  ScopedEnvOverride& operator=(const ScopedEnvOverride&) = delete;

private:
  static std::optional<std::string> ReadEnvVar(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  }

  const char* name_ = "";
  std::optional<std::string> previous_;
};

} // namespace chronosnap::tests::common

#endif // CHRONOSNAP_TESTS_COMMON_FIXTURES_HPP_
