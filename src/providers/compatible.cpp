#include "newsdesk/providers/compatible.hpp"

#include "newsdesk/common/fs.hpp"
#include "newsdesk/common/json_util.hpp"

#include <sstream>

namespace newsdesk::providers {

CompatibleProvider::CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                                       std::shared_ptr<HttpClient> http_client,
                                       const std::uint64_t timeout_ms)
    : name_(std::move(name)), base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)), timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string CompatibleProvider::build_body(const ChatRequest &request) const {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(request.model) << "\",";
  body << "\"messages\":[";
  if (request.system_prompt.has_value()) {
    body << "{\"role\":\"system\",\"content\":\"" << common::json_escape(*request.system_prompt)
         << "\"},";
  }
  body << "{\"role\":\"user\",\"content\":\"" << common::json_escape(request.message) << "\"}";
  body << "],";
  if (request.max_tokens.has_value()) {
    body << "\"max_tokens\":" << *request.max_tokens << ",";
  }
  body << "\"temperature\":" << request.temperature << ",";
  body << "\"stream\":false";
  body << "}";
  return body.str();
}

common::Result<std::string> CompatibleProvider::handle_response(const HttpResponse &response) const {
  if (const auto error = classify_response(response); error.has_value()) {
    return common::Result<std::string>::failure(provider_unavailable(*error));
  }

  auto parsed = parse_openai_content(response.body);
  if (!parsed.ok()) {
    return common::Result<std::string>::failure(provider_unavailable(
        ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = parsed.error()}));
  }
  return parsed;
}

common::Result<std::string> CompatibleProvider::chat(const ChatRequest &request) {
  if (api_key_.empty()) {
    return common::Result<std::string>::failure(provider_unavailable(
        ProviderError{.code = ProviderErrorCode::AuthError, .message = "missing API key"}));
  }

  const HttpHeaders headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };

  const auto response = http_client_->post_json(base_url_ + "/chat/completions", headers,
                                                 build_body(request), timeout_ms_);
  return handle_response(response);
}

std::string CompatibleProvider::name() const { return name_; }

} // namespace newsdesk::providers
