#include "tutorguard/providers/gemini.hpp"

#include "tutorguard/common/json.hpp"
#include "tutorguard/common/strings.hpp"

#include <sstream>

namespace tutorguard::providers {

namespace {

GenerationResult generation_failure(const GenerationErrorKind kind, const std::uint16_t status,
                                    std::string message) {
  return GenerationResult::failure(
      GenerationError{.kind = kind, .status = status, .message = std::move(message)});
}

void append_content(std::ostringstream &body, const std::string_view role,
                    const std::string &text) {
  body << "{\"role\":\"" << role << "\",\"parts\":[{\"text\":\"" << common::json_escape(text)
       << "\"}]}";
}

} // namespace

GeminiBackend::GeminiBackend(std::string base_url, std::string api_key,
                             const std::uint64_t timeout_ms,
                             std::shared_ptr<HttpClient> http_client)
    : base_url_(std::move(base_url)), api_key_(std::move(api_key)), timeout_ms_(timeout_ms),
      http_client_(std::move(http_client)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string GeminiBackend::name() const { return "gemini"; }

std::string GeminiBackend::endpoint(const std::string &model_id) const {
  return base_url_ + "/models/" + model_id + ":generateContent";
}

std::string GeminiBackend::build_body(const GenerationRequest &request) const {
  std::ostringstream body;
  body << "{";
  if (!request.system_persona.empty()) {
    body << "\"systemInstruction\":{\"parts\":[{\"text\":\""
         << common::json_escape(request.system_persona) << "\"}]},";
  }
  body << "\"contents\":[";
  for (const auto &turn : request.history) {
    append_content(body, turn_role_name(turn.role), turn.text);
    body << ",";
  }
  append_content(body, turn_role_name(TurnRole::User), request.wrapped_user_text);
  body << "],";
  body << "\"generationConfig\":{\"temperature\":" << request.temperature << "}";
  body << "}";
  return body.str();
}

GenerationResult GeminiBackend::invoke(const GenerationRequest &request) {
  if (request.cancellation.cancelled()) {
    return generation_failure(GenerationErrorKind::Cancelled, 0, "request cancelled");
  }
  if (api_key_.empty()) {
    return generation_failure(GenerationErrorKind::Other, 0, "missing API key");
  }

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"x-goog-api-key", api_key_},
  };
  const auto response = http_client_->post_json(endpoint(request.model_id), headers,
                                                build_body(request), timeout_ms_,
                                                request.cancellation);
  return handle_response(response);
}

GenerationResult GeminiBackend::handle_response(const HttpResponse &response) const {
  if (response.cancelled) {
    return generation_failure(GenerationErrorKind::Cancelled, 0, "request cancelled");
  }
  if (response.timeout) {
    return generation_failure(GenerationErrorKind::Other, 0, "request timed out");
  }
  if (response.network_error) {
    return generation_failure(classify_failure(0, response.network_error_message), 0,
                              response.network_error_message);
  }

  if (response.status < 200 || response.status >= 300) {
    const auto messages = common::json_string_values(response.body, "message");
    const auto statuses = common::json_string_values(response.body, "status");
    std::string message = messages.empty() ? response.body : messages.front();
    if (!statuses.empty()) {
      message = statuses.front() + ": " + message;
    }
    return generation_failure(classify_failure(response.status, message), response.status,
                              message);
  }

  auto parsed = parse_gemini_content(response.body);
  if (!parsed.ok()) {
    return generation_failure(GenerationErrorKind::Other, response.status, parsed.error());
  }
  return GenerationResult::success(parsed.value());
}

common::Result<std::string> parse_gemini_content(const std::string &response) {
  const auto candidates = response.find("\"candidates\"");
  if (candidates == std::string::npos) {
    return common::Result<std::string>::failure("response has no candidates");
  }

  const auto parts = common::json_string_values(response, "text", candidates);
  if (parts.empty()) {
    return common::Result<std::string>::failure("candidate has no text parts");
  }

  std::string text;
  for (const auto &part : parts) {
    text += part;
  }
  return common::Result<std::string>::success(std::move(text));
}

common::Result<std::unique_ptr<GenerationBackend>>
create_backend(const config::BackendConfig &config) {
  using Outcome = common::Result<std::unique_ptr<GenerationBackend>>;
  const std::string kind = common::to_lower(common::trim(config.kind));
  if (kind == "gemini") {
    return Outcome::success(std::make_unique<GeminiBackend>(
        config.base_url, config.api_key.value_or(""), config.timeout_ms));
  }
  return Outcome::failure("unknown backend kind: " + config.kind);
}

} // namespace tutorguard::providers
