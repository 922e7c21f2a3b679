#pragma once

#include "newsdesk/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace newsdesk::persistence {

struct TarMember {
  /// Name inside the archive; a plain file name, no directories.
  std::string name;
  std::filesystem::path source;
};

/// Writes a POSIX ustar archive of regular files.
[[nodiscard]] common::Status write_tar(const std::filesystem::path &archive,
                                       const std::vector<TarMember> &members);

/// Extracts every member of a ustar archive into `directory`. Corrupt on a bad
/// header checksum, a non-regular member, a name with a path separator or
/// "..", a duplicate name, or truncation.
[[nodiscard]] common::Result<std::vector<std::string>>
extract_tar(const std::filesystem::path &archive, const std::filesystem::path &directory);

[[nodiscard]] bool is_safe_member_name(const std::string &name);

} // namespace newsdesk::persistence
