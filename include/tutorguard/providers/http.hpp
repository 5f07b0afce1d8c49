#pragma once

#include "tutorguard/providers/traits.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace tutorguard::providers {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool cancelled = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms,
            const CancellationToken &cancellation) = 0;
};

/// libcurl transport. A cancelled token aborts the transfer from the progress callback.
class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms,
            const CancellationToken &cancellation) override;
};

} // namespace tutorguard::providers
