#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace safelayer::common {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;

  [[nodiscard]] bool success() const { return !network_error && status >= 200 && status < 300; }
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                         std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body,
                                       std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                 std::uint64_t timeout_ms) override;
};

} // namespace safelayer::common
