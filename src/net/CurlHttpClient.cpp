#include "CurlHttpClient.h"

#include <curl/curl.h>

#include <format>
#include <memory>
#include <stdexcept>

namespace {

constexpr const char* kUserAgent = "EmaCrossWatch/1.0";

size_t WriteCallback(char* contents, size_t size, size_t nmemb,
                     void* userdata) {
  auto* response = static_cast<std::string*>(userdata);
  response->append(contents, size * nmemb);
  return size * nmemb;
}

struct CurlEasyDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

CurlGlobal::CurlGlobal() {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("curl_global_init failed");
  }
}

CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

std::expected<HttpResponse, std::string> CurlHttpClient::get(
    const std::string& url, std::chrono::nanoseconds timeout) {
  return perform(url, nullptr, timeout);
}

std::expected<HttpResponse, std::string> CurlHttpClient::postJson(
    const std::string& url, const std::string& body,
    std::chrono::nanoseconds timeout) {
  return perform(url, &body, timeout);
}

std::expected<HttpResponse, std::string> CurlHttpClient::perform(
    const std::string& url, const std::string* body,
    std::chrono::nanoseconds timeout) {
  std::unique_ptr<CURL, CurlEasyDeleter> handle(curl_easy_init());
  if (!handle) {
    return std::unexpected("Failed to initialize CURL handle");
  }

  std::unique_ptr<curl_slist, CurlSlistDeleter> headers;
  HttpResponse response;
  const long timeout_ms = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());

  curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, kUserAgent);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_SSL_VERIFYHOST, 2L);

  if (body != nullptr) {
    headers.reset(
        curl_slist_append(nullptr, "Content-Type: application/json"));
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body->size()));
  }

  const CURLcode result = curl_easy_perform(handle.get());
  if (result != CURLE_OK) {
    return std::unexpected(std::format("HTTP {} failed: {}",
                                       body != nullptr ? "POST" : "GET",
                                       curl_easy_strerror(result)));
  }

  if (curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE,
                        &response.status_code) != CURLE_OK) {
    return std::unexpected("Failed to read HTTP response code");
  }
  return response;
}
