#include "http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ferry::steps {

using ferry::observability::IntField;
using ferry::observability::StringField;
using ferry::util::HttpError;

namespace {

constexpr long kDefaultTimeoutMs = 30000;

std::once_flag g_curl_init;

size_t WriteBody(char* data, size_t size, size_t count, void* userdata) {
  static_cast<std::string*>(userdata)->append(data, size * count);
  return size * count;
}

struct CurlDeleter {
  void operator()(CURL* curl) const {
    curl_easy_cleanup(curl);
  }
};

struct HeaderListDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

} // namespace

HttpClient::HttpClient(const ferry::runtime::config::HttpConfig& config) : config_(config) {
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse HttpClient::Send(const HttpRequest& request) const {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw HttpError(0, "failed to initialize HTTP client");
  }

  std::unique_ptr<curl_slist, HeaderListDeleter> headers;
  for (const auto& [name, value] : request.headers) {
    const std::string line = name + ": " + value;
    curl_slist*       next = curl_slist_append(headers.get(), line.c_str());
    if (next == nullptr) throw HttpError(0, "failed to build request headers");
    headers.release();
    headers.reset(next);
  }

  HttpResponse response;
  const long   timeout = config_.timeout_ms() > 0 ? config_.timeout_ms() : kDefaultTimeoutMs;

  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, config_.follow_redirects() ? 1L : 0L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  if (headers) curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  if (!request.body.empty()) {
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  }

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw HttpError(0, request.method + " " + request.url + ": " + curl_easy_strerror(res));
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

  FERRY_LOG_DEBUG("http request", {StringField("method", request.method), StringField("url", request.url),
                                   IntField("status", response.status)});
  return response;
}

} // namespace ferry::steps
