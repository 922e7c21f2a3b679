#include "newsdesk/persistence/tar.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <set>

namespace newsdesk::persistence {

namespace {

constexpr std::size_t kBlockSize = 512;
constexpr std::size_t kNameSize = 100;
constexpr std::size_t kSizeOffset = 124;
constexpr std::size_t kSizeField = 12;
constexpr std::size_t kChecksumOffset = 148;
constexpr std::size_t kChecksumField = 8;
constexpr std::size_t kTypeOffset = 156;
constexpr std::size_t kMagicOffset = 257;
constexpr std::size_t kCopyBuffer = 64 * 1024;

using Block = std::array<char, kBlockSize>;

void write_octal(Block &block, const std::size_t offset, const std::size_t width,
                 std::uint64_t value) {
  // width - 1 octal digits followed by NUL.
  block[offset + width - 1] = '\0';
  for (std::size_t i = width - 1; i > 0; --i) {
    block[offset + i - 1] = static_cast<char>('0' + (value & 7U));
    value >>= 3U;
  }
}

bool read_octal(const Block &block, const std::size_t offset, const std::size_t width,
                std::uint64_t &out) {
  out = 0;
  std::size_t i = 0;
  while (i < width && block[offset + i] == ' ') {
    ++i;
  }
  bool any = false;
  for (; i < width; ++i) {
    const char ch = block[offset + i];
    if (ch == '\0' || ch == ' ') {
      break;
    }
    if (ch < '0' || ch > '7') {
      return false;
    }
    out = (out << 3U) | static_cast<std::uint64_t>(ch - '0');
    any = true;
  }
  return any;
}

std::uint64_t header_checksum(const Block &block) {
  std::uint64_t sum = 0;
  for (std::size_t i = 0; i < kBlockSize; ++i) {
    const bool in_checksum = i >= kChecksumOffset && i < kChecksumOffset + kChecksumField;
    sum += in_checksum ? static_cast<unsigned char>(' ') : static_cast<unsigned char>(block[i]);
  }
  return sum;
}

Block make_header(const std::string &name, const std::uint64_t size) {
  Block block{};
  std::memcpy(block.data(), name.data(), name.size());
  write_octal(block, 100, 8, 0644);
  write_octal(block, 108, 8, 0);
  write_octal(block, 116, 8, 0);
  write_octal(block, kSizeOffset, kSizeField, size);
  write_octal(block, 136, 12, 0);
  block[kTypeOffset] = '0';
  std::memcpy(block.data() + kMagicOffset, "ustar", 6);
  block[263] = '0';
  block[264] = '0';

  const std::uint64_t checksum = header_checksum(block);
  write_octal(block, kChecksumOffset, 7, checksum);
  block[kChecksumOffset + 7] = ' ';
  return block;
}

bool is_zero_block(const Block &block) {
  return std::all_of(block.begin(), block.end(), [](const char ch) { return ch == '\0'; });
}

template <typename T> common::Result<T> corrupt(const std::string &message) {
  return common::Result<T>::failure(common::ErrorCode::Corrupt, "archive: " + message);
}

} // namespace

bool is_safe_member_name(const std::string &name) {
  if (name.empty() || name.size() >= kNameSize || name == "." || name == "..") {
    return false;
  }
  return name.find('/') == std::string::npos && name.find('\\') == std::string::npos &&
         name.find("..") == std::string::npos;
}

common::Status write_tar(const std::filesystem::path &archive,
                         const std::vector<TarMember> &members) {
  std::ofstream out(archive, std::ios::binary | std::ios::trunc);
  if (!out) {
    return common::Status::error(common::ErrorCode::IoError,
                                 "cannot open " + archive.string() + " for write");
  }

  std::vector<char> buffer(kCopyBuffer);
  for (const auto &member : members) {
    if (!is_safe_member_name(member.name)) {
      return common::Status::error(common::ErrorCode::InvalidArgument,
                                   "invalid archive member name: " + member.name);
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(member.source, ec);
    if (ec) {
      return common::Status::error(common::ErrorCode::IoError,
                                   "cannot stat " + member.source.string() + ": " + ec.message());
    }
    std::ifstream in(member.source, std::ios::binary);
    if (!in) {
      return common::Status::error(common::ErrorCode::IoError,
                                   "cannot read " + member.source.string());
    }

    const Block header = make_header(member.name, size);
    out.write(header.data(), kBlockSize);

    std::uint64_t remaining = size;
    while (remaining > 0) {
      const auto chunk = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, kCopyBuffer));
      in.read(buffer.data(), chunk);
      if (in.gcount() != chunk) {
        return common::Status::error(common::ErrorCode::IoError,
                                     member.source.string() + " changed while archiving");
      }
      out.write(buffer.data(), chunk);
      remaining -= static_cast<std::uint64_t>(chunk);
    }

    const std::size_t padding = (kBlockSize - size % kBlockSize) % kBlockSize;
    const Block zeros{};
    out.write(zeros.data(), static_cast<std::streamsize>(padding));
  }

  const Block zeros{};
  out.write(zeros.data(), kBlockSize);
  out.write(zeros.data(), kBlockSize);
  out.flush();
  if (!out) {
    return common::Status::error(common::ErrorCode::IoError, "failed writing " + archive.string());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> extract_tar(const std::filesystem::path &archive,
                                                     const std::filesystem::path &directory) {
  using NamesResult = common::Result<std::vector<std::string>>;

  std::ifstream in(archive, std::ios::binary);
  if (!in) {
    return NamesResult::failure(common::ErrorCode::NotFound, "cannot open " + archive.string());
  }

  std::vector<std::string> names;
  std::set<std::string> seen;
  std::vector<char> buffer(kCopyBuffer);
  bool terminated = false;

  while (true) {
    Block header{};
    in.read(header.data(), kBlockSize);
    if (in.gcount() == 0 && in.eof()) {
      break;
    }
    if (in.gcount() != static_cast<std::streamsize>(kBlockSize)) {
      return corrupt<std::vector<std::string>>("truncated header");
    }
    if (is_zero_block(header)) {
      terminated = true;
      break;
    }

    std::uint64_t stored_checksum = 0;
    if (!read_octal(header, kChecksumOffset, kChecksumField, stored_checksum) ||
        stored_checksum != header_checksum(header)) {
      return corrupt<std::vector<std::string>>("header checksum mismatch");
    }
    if (std::memcmp(header.data() + kMagicOffset, "ustar", 5) != 0) {
      return corrupt<std::vector<std::string>>("not a ustar archive");
    }
    const char type = header[kTypeOffset];
    if (type != '0' && type != '\0') {
      return corrupt<std::vector<std::string>>("unsupported member type");
    }

    const std::string name(header.data(), strnlen(header.data(), kNameSize));
    if (!is_safe_member_name(name)) {
      return corrupt<std::vector<std::string>>("unsafe member name '" + name + "'");
    }
    if (!seen.insert(name).second) {
      return corrupt<std::vector<std::string>>("duplicate member " + name);
    }
    std::uint64_t size = 0;
    if (!read_octal(header, kSizeOffset, kSizeField, size)) {
      return corrupt<std::vector<std::string>>("bad size for " + name);
    }

    std::ofstream out(directory / name, std::ios::binary | std::ios::trunc);
    if (!out) {
      return NamesResult::failure(common::ErrorCode::IoError,
                                  "cannot create " + (directory / name).string());
    }
    std::uint64_t remaining = size;
    while (remaining > 0) {
      const auto chunk = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, kCopyBuffer));
      in.read(buffer.data(), chunk);
      if (in.gcount() != chunk) {
        return corrupt<std::vector<std::string>>("truncated data for " + name);
      }
      out.write(buffer.data(), chunk);
      remaining -= static_cast<std::uint64_t>(chunk);
    }
    out.flush();
    if (!out) {
      return NamesResult::failure(common::ErrorCode::IoError,
                                  "failed writing " + (directory / name).string());
    }

    const std::size_t padding = (kBlockSize - size % kBlockSize) % kBlockSize;
    in.ignore(static_cast<std::streamsize>(padding));
    if (in.gcount() != static_cast<std::streamsize>(padding)) {
      return corrupt<std::vector<std::string>>("truncated padding for " + name);
    }
    names.push_back(name);
  }

  if (!terminated) {
    return corrupt<std::vector<std::string>>("missing end-of-archive marker");
  }
  return NamesResult::success(std::move(names));
}

} // namespace newsdesk::persistence
