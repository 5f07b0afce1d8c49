#pragma once

#include "tutorguard/config/schema.hpp"
#include "tutorguard/providers/http.hpp"
#include "tutorguard/providers/traits.hpp"

#include <memory>
#include <string>

namespace tutorguard::providers {

/// `generateContent` client for the hosted Gemini API.
class GeminiBackend final : public GenerationBackend {
public:
  GeminiBackend(std::string base_url, std::string api_key, std::uint64_t timeout_ms,
                std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

  [[nodiscard]] GenerationResult invoke(const GenerationRequest &request) override;
  [[nodiscard]] std::string name() const override;

  [[nodiscard]] std::string build_body(const GenerationRequest &request) const;
  [[nodiscard]] std::string endpoint(const std::string &model_id) const;

private:
  [[nodiscard]] GenerationResult handle_response(const HttpResponse &response) const;

  std::string base_url_;
  std::string api_key_;
  std::uint64_t timeout_ms_;
  std::shared_ptr<HttpClient> http_client_;
};

/// Concatenated `candidates[0].content.parts[*].text` of a generateContent reply.
[[nodiscard]] common::Result<std::string> parse_gemini_content(const std::string &response);

[[nodiscard]] common::Result<std::unique_ptr<GenerationBackend>>
create_backend(const config::BackendConfig &config);

} // namespace tutorguard::providers
