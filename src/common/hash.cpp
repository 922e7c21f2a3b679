#include "newsdesk/common/hash.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace newsdesk::common {

namespace {

std::string to_hex(const unsigned char *digest, const std::size_t length) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < length; ++i) {
    stream << std::setw(2) << static_cast<int>(digest[i]);
  }
  return stream.str();
}

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

std::string sha256_hex(const std::string_view data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest);
  return to_hex(digest, SHA256_DIGEST_LENGTH);
}

Result<std::string> sha256_file_hex(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure(ErrorCode::IoError, "Unable to open " + path.string());
  }

  std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
  if (ctx == nullptr || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return Result<std::string>::failure(ErrorCode::Internal, "sha256 init failed");
  }

  std::array<char, 64 * 1024> buffer{};
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = in.gcount();
    if (got > 0 &&
        EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
      return Result<std::string>::failure(ErrorCode::Internal, "sha256 update failed");
    }
  }
  if (in.bad()) {
    return Result<std::string>::failure(ErrorCode::IoError, "Failed reading " + path.string());
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
    return Result<std::string>::failure(ErrorCode::Internal, "sha256 final failed");
  }
  return Result<std::string>::success(to_hex(digest, length));
}

} // namespace newsdesk::common
