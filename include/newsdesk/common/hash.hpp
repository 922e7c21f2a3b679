#pragma once

#include "newsdesk/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace newsdesk::common {

[[nodiscard]] std::string sha256_hex(std::string_view data);

/// Streams the file through SHA-256 without loading it whole.
[[nodiscard]] Result<std::string> sha256_file_hex(const std::filesystem::path &path);

} // namespace newsdesk::common
