#pragma once

#include "couponvault/common/result.hpp"
#include <filesystem>
#include <string>

namespace couponvault::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string to_upper(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

// Temp file plus rename; `private_mode` makes the result owner-only.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path, const std::string &content,
                                       bool private_mode = false);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

} // namespace couponvault::common
