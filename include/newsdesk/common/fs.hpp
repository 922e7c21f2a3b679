#pragma once

#include "newsdesk/common/result.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace newsdesk::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Number of Unicode code points in a UTF-8 string.
[[nodiscard]] std::size_t utf8_length(std::string_view text);

/// Cut to at most max_code_points without splitting a multi-byte sequence.
[[nodiscard]] std::string utf8_truncate(std::string_view text, std::size_t max_code_points);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path, const std::string &content);

} // namespace newsdesk::common
