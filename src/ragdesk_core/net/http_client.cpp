#include "ragdesk_core/net/http_client.hpp"

#include <curl/curl.h>

#include "ragdesk_core/errors.hpp"

namespace ragdesk_core {
namespace {

// Initialized once and never cleaned up: requests abandoned by a deadline may
// still be running inside libcurl while static destructors run at exit.
void ensure_curl_global_init() {
  static const CURLcode init_code = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (init_code != CURLE_OK) {
    throw UpstreamError(std::string("curl_global_init failed: ") + curl_easy_strerror(init_code));
  }
}

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const size_t total = size * nmemb;
  auto *buffer = static_cast<std::string *>(userdata);
  buffer->append(ptr, total);
  return total;
}

}  // namespace

HttpResponse perform_http_request(const HttpRequest &request) {
  ensure_curl_global_init();
  CURL *curl = curl_easy_init();
  if (!curl) {
    throw UpstreamError("Failed to initialize curl");
  }

  std::string response_body;
  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  // Worker threads may be abandoned after a deadline, signals must stay off
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  if (request.timeout_seconds > 0) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, request.timeout_seconds);
  }

  struct curl_slist *headers = nullptr;
  for (const auto &header : request.headers) {
    headers = curl_slist_append(headers, header.c_str());
  }
  if (headers != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  }

  if (!request.body.empty()) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  } else if (request.method == "POST" || request.method == "PUT") {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
  }

  CURLcode code = curl_easy_perform(curl);
  long status_code = 0;
  if (code == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
  }

  if (headers != nullptr) {
    curl_slist_free_all(headers);
  }
  curl_easy_cleanup(curl);

  if (code != CURLE_OK) {
    throw UpstreamError(std::string("HTTP request to ") + request.url +
                        " failed: " + curl_easy_strerror(code));
  }
  return HttpResponse{status_code, std::move(response_body)};
}

}  // namespace ragdesk_core
