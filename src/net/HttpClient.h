#ifndef EMACROSSWATCH_HTTPCLIENT_H
#define EMACROSSWATCH_HTTPCLIENT_H

#include <chrono>
#include <expected>
#include <string>

struct HttpResponse {
  long status_code = 0;
  std::string body;
};

// Transport failures (DNS, TLS, timeout) are reported as the error string.
// HTTP error statuses are returned as a response for the caller to judge.
struct IHttpClient {
  virtual ~IHttpClient() = default;
  virtual std::expected<HttpResponse, std::string> get(
      const std::string& url, std::chrono::nanoseconds timeout) = 0;
  virtual std::expected<HttpResponse, std::string> postJson(
      const std::string& url, const std::string& body,
      std::chrono::nanoseconds timeout) = 0;
};

#endif  // EMACROSSWATCH_HTTPCLIENT_H
