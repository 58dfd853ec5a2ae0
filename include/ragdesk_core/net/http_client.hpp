#pragma once

#include <string>
#include <vector>

namespace ragdesk_core {

struct HttpRequest {
  std::string method = "GET";
  std::string url;
  std::vector<std::string> headers;
  std::string body;
  long timeout_seconds = 30;
};

struct HttpResponse {
  long status = 0;
  std::string body;
};

// Blocking libcurl request. Transport failures throw UpstreamError; HTTP error
// statuses are returned to the caller.
HttpResponse perform_http_request(const HttpRequest &request);

}  // namespace ragdesk_core
