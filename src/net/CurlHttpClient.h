#ifndef EMACROSSWATCH_CURLHTTPCLIENT_H
#define EMACROSSWATCH_CURLHTTPCLIENT_H

#include <string>

#include "HttpClient.h"

// Holds curl_global_init for the lifetime of the process.
class CurlGlobal {
 public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// One easy handle per request, so instances can be shared across fetch
// workers.
class CurlHttpClient : public IHttpClient {
 public:
  CurlHttpClient() = default;

  std::expected<HttpResponse, std::string> get(
      const std::string& url, std::chrono::nanoseconds timeout) override;
  std::expected<HttpResponse, std::string> postJson(
      const std::string& url, const std::string& body,
      std::chrono::nanoseconds timeout) override;

 private:
  std::expected<HttpResponse, std::string> perform(
      const std::string& url, const std::string* body,
      std::chrono::nanoseconds timeout);
};

#endif  // EMACROSSWATCH_CURLHTTPCLIENT_H
