#pragma once

#include <map>
#include <string>

#include "config/config.pb.h"

namespace ferry::steps {

struct HttpRequest {
  std::string                        method{"GET"};
  std::string                        url;
  std::string                        body;
  std::map<std::string, std::string> headers;
};

struct HttpResponse {
  long        status{0};
  std::string body;
};

/*
  One blocking request per call over libcurl.

  Transport failures throw HttpError with status 0. A response with any
  status is returned as-is; callers decide what counts as failure.
*/
class HttpClient {
 public:
  explicit HttpClient(const ferry::runtime::config::HttpConfig& config);
  virtual ~HttpClient() = default;

  virtual HttpResponse Send(const HttpRequest& request) const;

 private:
  ferry::runtime::config::HttpConfig config_;
};

} // namespace ferry::steps
