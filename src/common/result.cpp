#include "newsdesk/common/result.hpp"

namespace newsdesk::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::ConfigurationError:
    return "configuration_error";
  case ErrorCode::ProviderUnavailable:
    return "provider_unavailable";
  case ErrorCode::SynthesisError:
    return "synthesis_error";
  case ErrorCode::EmptyIndex:
    return "empty_index";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::Corrupt:
    return "corrupt";
  case ErrorCode::ImportRejected:
    return "import_rejected";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::IoError:
    return "io_error";
  case ErrorCode::Internal:
    return "internal";
  }
  return "unknown";
}

std::string Error::to_string() const {
  std::string out = "[";
  out += error_code_name(code);
  out += "]";
  if (!message.empty()) {
    out += " " + message;
  }
  return out;
}

} // namespace newsdesk::common
