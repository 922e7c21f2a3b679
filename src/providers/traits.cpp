#include "newsdesk/providers/traits.hpp"

#include "newsdesk/common/fs.hpp"
#include "newsdesk/common/json_util.hpp"

#include <curl/curl.h>

#include <charconv>
#include <sstream>

namespace newsdesk::providers {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<HttpHeaders *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

std::optional<std::uint64_t> parse_retry_after(const HttpResponse &response) {
  const auto it = response.headers.find("retry-after");
  if (it == response.headers.end()) {
    return std::nullopt;
  }
  const std::string value = common::trim(it->second);
  std::uint64_t seconds = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return seconds;
}

} // namespace

std::string ProviderError::to_string() const {
  std::ostringstream stream;
  stream << "Provider error [";
  switch (code) {
  case ProviderErrorCode::ApiError:
    stream << "api";
    break;
  case ProviderErrorCode::NetworkError:
    stream << "network";
    break;
  case ProviderErrorCode::AuthError:
    stream << "auth";
    break;
  case ProviderErrorCode::RateLimitError:
    stream << "rate_limit";
    break;
  case ProviderErrorCode::ModelNotFound:
    stream << "model_not_found";
    break;
  case ProviderErrorCode::InvalidResponse:
    stream << "invalid_response";
    break;
  case ProviderErrorCode::Timeout:
    stream << "timeout";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (retry_after.has_value()) {
    stream << " retry_after=" << *retry_after;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "newsdesk/0.1");
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

std::optional<ProviderError> classify_response(const HttpResponse &response) {
  if (response.timeout) {
    return ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"};
  }
  if (response.network_error) {
    return ProviderError{.code = ProviderErrorCode::NetworkError,
                         .message = response.network_error_message};
  }
  if (response.status == 401 || response.status == 403) {
    return ProviderError{
        .code = ProviderErrorCode::AuthError, .status = response.status, .message = response.body};
  }
  if (response.status == 404) {
    return ProviderError{.code = ProviderErrorCode::ModelNotFound,
                         .status = response.status,
                         .message = response.body};
  }
  if (response.status == 429) {
    return ProviderError{.code = ProviderErrorCode::RateLimitError,
                         .status = response.status,
                         .message = response.body,
                         .retry_after = parse_retry_after(response)};
  }
  if (response.status < 200 || response.status >= 300) {
    return ProviderError{
        .code = ProviderErrorCode::ApiError, .status = response.status, .message = response.body};
  }
  return std::nullopt;
}

bool is_retryable(const ProviderError &error) {
  return error.code != ProviderErrorCode::AuthError &&
         error.code != ProviderErrorCode::ModelNotFound;
}

common::Error provider_unavailable(const ProviderError &error) {
  return common::Error{.code = common::ErrorCode::ProviderUnavailable,
                       .message = error.to_string(),
                       .retryable = is_retryable(error),
                       .retry_after_seconds = error.retry_after};
}

common::Result<std::string> parse_openai_content(const std::string &response) {
  const std::string choices = common::json_get_array(response, "choices");
  if (choices.empty()) {
    return common::Result<std::string>::failure("choices field missing");
  }

  const auto key_pos = common::json_find_key(choices, "content");
  if (key_pos == std::string::npos) {
    return common::Result<std::string>::failure("choices[0].message.content missing");
  }
  const auto colon = choices.find(':', key_pos);
  const auto value_pos = common::json_skip_ws(choices, colon + 1);
  if (colon == std::string::npos || value_pos >= choices.size() || choices[value_pos] != '"') {
    return common::Result<std::string>::failure("choices[0].message.content is not a string");
  }
  return common::Result<std::string>::success(common::json_get_string(choices, "content"));
}

} // namespace newsdesk::providers
