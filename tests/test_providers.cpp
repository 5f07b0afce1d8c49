#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "tutorguard/common/json.hpp"
#include "tutorguard/providers/gemini.hpp"

#include <memory>
#include <string>
#include <vector>

namespace {

namespace prov = tutorguard::providers;
namespace tg = tutorguard::testing;

constexpr const char *kSuccessBody =
    R"({"candidates":[{"content":{"parts":[{"text":"Hello "},{"text":"student\n"}],"role":"model"},)"
    R"("finishReason":"STOP"}],"usageMetadata":{"totalTokenCount":12}})";

constexpr const char *kQuotaBody =
    R"({"error":{"code":429,"message":"You exceeded your current quota.","status":"RESOURCE_EXHAUSTED"}})";

prov::GenerationRequest sample_request() {
  prov::GenerationRequest request;
  request.system_persona = "You are a tutor.";
  request.wrapped_user_text = "What is \"pi\"?";
  request.model_id = "gemini-2.5-flash";
  request.history = {{prov::TurnRole::User, "hi"}, {prov::TurnRole::Model, "hello"}};
  request.temperature = 0.7;
  return request;
}

struct GeminiFixture {
  std::shared_ptr<tg::MockHttpClient> http = std::make_shared<tg::MockHttpClient>();
  prov::GeminiBackend backend{"https://example.test/v1beta/", "secret-key", 5000, http};
};

} // namespace

void register_provider_tests(std::vector<tutorguard::tests::TestCase> &tests) {
  using tutorguard::tests::require;

  tests.push_back({"classify_failure_detects_quota", [] {
                     using prov::GenerationErrorKind;
                     require(prov::classify_failure(429, "") == GenerationErrorKind::Quota, "429");
                     require(prov::classify_failure(0, "RESOURCE_EXHAUSTED: try later") ==
                                 GenerationErrorKind::Quota,
                             "resource exhausted marker");
                     require(prov::classify_failure(400, "Quota exceeded for model") ==
                                 GenerationErrorKind::Quota,
                             "quota marker");
                     require(prov::classify_failure(500, "got 429 upstream") ==
                                 GenerationErrorKind::Quota,
                             "429 inside message");
                     require(prov::classify_failure(500, "internal error") ==
                                 GenerationErrorKind::Other,
                             "plain failure");
                   }});

  tests.push_back({"generation_error_to_string", [] {
                     const prov::GenerationError error{
                         .kind = prov::GenerationErrorKind::Quota, .status = 429, .message = "slow down"};
                     require(error.to_string() == "Generation error [quota] status=429: slow down",
                             error.to_string());
                   }});

  tests.push_back({"cancellation_token_copies_share_flag", [] {
                     const prov::CancellationToken token;
                     const prov::CancellationToken copy = token;
                     require(!copy.cancelled(), "starts clear");
                     token.cancel();
                     require(copy.cancelled(), "copy sees cancellation");
                   }});

  tests.push_back({"gemini_builds_request", [] {
                     GeminiFixture fx;
                     fx.http->next_post.status = 200;
                     fx.http->next_post.body = kSuccessBody;
                     const auto result = fx.backend.invoke(sample_request());
                     require(result.ok(), "success expected");
                     require(fx.http->last_url ==
                                 "https://example.test/v1beta/models/gemini-2.5-flash:generateContent",
                             fx.http->last_url);
                     require(fx.http->last_headers.at("x-goog-api-key") == "secret-key", "key header");
                     require(fx.http->last_headers.at("Content-Type") == "application/json",
                             "content type");

                     const auto &body = fx.http->last_body;
                     require(body.find(R"("systemInstruction":{"parts":[{"text":"You are a tutor."}]})") !=
                                 std::string::npos,
                             "system instruction: " + body);
                     const auto history_user = body.find(R"({"role":"user","parts":[{"text":"hi"}]})");
                     const auto history_model = body.find(R"({"role":"model","parts":[{"text":"hello"}]})");
                     const auto current = body.find(R"(What is \"pi\"?)");
                     require(history_user != std::string::npos && history_model != std::string::npos &&
                                 current != std::string::npos,
                             "contents: " + body);
                     require(history_user < history_model && history_model < current,
                             "history precedes the new message");
                     require(body.find(R"("generationConfig":{"temperature":0.7})") != std::string::npos,
                             "temperature: " + body);
                   }});

  tests.push_back({"gemini_parses_success", [] {
                     GeminiFixture fx;
                     fx.http->next_post.status = 200;
                     fx.http->next_post.body = kSuccessBody;
                     const auto result = fx.backend.invoke(sample_request());
                     require(result.ok(), "success expected");
                     require(result.value() == "Hello student\n", "joined parts: " + result.value());
                   }});

  tests.push_back({"gemini_maps_quota_response", [] {
                     GeminiFixture fx;
                     fx.http->next_post.status = 429;
                     fx.http->next_post.body = kQuotaBody;
                     const auto result = fx.backend.invoke(sample_request());
                     require(!result.ok(), "failure expected");
                     require(result.error().kind == prov::GenerationErrorKind::Quota, "quota kind");
                     require(result.error().status == 429, "status kept");
                     require(result.error().message ==
                                 "RESOURCE_EXHAUSTED: You exceeded your current quota.",
                             result.error().message);
                   }});

  tests.push_back({"gemini_maps_quota_text_on_other_status", [] {
                     GeminiFixture fx;
                     fx.http->next_post.status = 403;
                     fx.http->next_post.body =
                         R"({"error":{"code":403,"message":"Quota exceeded for project"}})";
                     const auto result = fx.backend.invoke(sample_request());
                     require(!result.ok(), "failure expected");
                     require(result.error().kind == prov::GenerationErrorKind::Quota,
                             "quota message classified as quota");
                   }});

  tests.push_back({"gemini_maps_server_error_to_other", [] {
                     GeminiFixture fx;
                     fx.http->next_post.status = 500;
                     fx.http->next_post.body =
                         R"({"error":{"code":500,"message":"Internal error","status":"INTERNAL"}})";
                     const auto result = fx.backend.invoke(sample_request());
                     require(!result.ok(), "failure expected");
                     require(result.error().kind == prov::GenerationErrorKind::Other, "other kind");
                     require(result.error().message == "INTERNAL: Internal error",
                             result.error().message);
                   }});

  tests.push_back({"gemini_maps_transport_failures", [] {
                     GeminiFixture fx;
                     fx.http->next_post.timeout = true;
                     auto timed_out = fx.backend.invoke(sample_request());
                     require(!timed_out.ok() &&
                                 timed_out.error().kind == prov::GenerationErrorKind::Other,
                             "timeout is other");

                     fx.http->next_post = prov::HttpResponse{};
                     fx.http->next_post.network_error = true;
                     fx.http->next_post.network_error_message = "Could not resolve host";
                     auto network = fx.backend.invoke(sample_request());
                     require(!network.ok() && network.error().message == "Could not resolve host",
                             "network error message kept");
                   }});

  tests.push_back({"gemini_rejects_malformed_success_body", [] {
                     GeminiFixture fx;
                     fx.http->next_post.status = 200;
                     fx.http->next_post.body = R"({"promptFeedback":{"blockReason":"SAFETY"}})";
                     const auto result = fx.backend.invoke(sample_request());
                     require(!result.ok(), "no candidates is a failure");
                     require(result.error().kind == prov::GenerationErrorKind::Other, "other kind");
                     require(result.error().message == "response has no candidates",
                             result.error().message);
                   }});

  tests.push_back({"gemini_honours_cancellation", [] {
                     GeminiFixture fx;
                     auto request = sample_request();
                     request.cancellation.cancel();
                     const auto result = fx.backend.invoke(request);
                     require(!result.ok(), "cancelled request fails");
                     require(result.error().kind == prov::GenerationErrorKind::Cancelled,
                             "cancelled kind");
                     require(fx.http->calls == 0, "no HTTP call after cancellation");
                   }});

  tests.push_back({"gemini_requires_api_key", [] {
                     auto http = std::make_shared<tg::MockHttpClient>();
                     prov::GeminiBackend backend("https://example.test", "", 1000, http);
                     const auto result = backend.invoke(sample_request());
                     require(!result.ok(), "missing key fails");
                     require(result.error().message == "missing API key", result.error().message);
                     require(http->calls == 0, "no HTTP call without a key");
                   }});

  tests.push_back({"parse_gemini_content_edge_cases", [] {
                     require(!prov::parse_gemini_content("{}").ok(), "no candidates");
                     const auto empty_parts =
                         prov::parse_gemini_content(R"({"candidates":[{"content":{"parts":[]}}]})");
                     require(!empty_parts.ok(), "no parts");
                     require(empty_parts.error() == "candidate has no text parts", empty_parts.error());
                     const auto escaped = prov::parse_gemini_content(
                         R"({"candidates":[{"content":{"parts":[{"text":"a \"quoted\" A"}]}}]})");
                     require(escaped.ok() && escaped.value() == "a \"quoted\" A", "escapes decoded");
                   }});

  tests.push_back({"json_escape_control_characters", [] {
                     const auto escaped = tutorguard::common::json_escape("a\"b\\c\nd\te");
                     require(escaped == R"(a\"b\\c\nd\te)", escaped);
                   }});

  tests.push_back({"create_backend_by_kind", [] {
                     tutorguard::config::BackendConfig config;
                     config.api_key = "k";
                     auto backend = prov::create_backend(config);
                     require(backend.ok(), "gemini backend");
                     require(backend.value()->name() == "gemini", "backend name");

                     config.kind = "mystery";
                     auto unknown = prov::create_backend(config);
                     require(!unknown.ok(), "unknown kind fails");
                     require(unknown.error() == "unknown backend kind: mystery", unknown.error());
                   }});
}
