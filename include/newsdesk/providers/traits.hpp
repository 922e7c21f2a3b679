#pragma once

#include "newsdesk/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace newsdesk::providers {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
};

struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;
};

struct ChatRequest {
  std::string model;
  std::optional<std::string> system_prompt;
  std::string message;
  double temperature = 0.3;
  std::optional<std::uint32_t> max_tokens;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, std::uint64_t timeout_ms) override;
};

class Provider {
public:
  virtual ~Provider() = default;

  [[nodiscard]] virtual common::Result<std::string> chat(const ChatRequest &request) = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

/// Maps a transport or non-2xx response to a ProviderError; nullopt for success.
[[nodiscard]] std::optional<ProviderError> classify_response(const HttpResponse &response);

/// Auth failures and unknown models fail the same way on every attempt.
[[nodiscard]] bool is_retryable(const ProviderError &error);

/// ProviderUnavailable carrying the rendered provider error, its retryability
/// and any Retry-After hint.
[[nodiscard]] common::Error provider_unavailable(const ProviderError &error);

[[nodiscard]] common::Result<std::string> parse_openai_content(const std::string &response);

} // namespace newsdesk::providers
