#include "ragdesk_core/llm/http_transport.hpp"

namespace ragdesk_core {

CurlHttpTransport::CurlHttpTransport(long timeout_seconds)
    : curl_handle_(curl_easy_init()), timeout_seconds_(timeout_seconds) {
  if (!curl_handle_) {
    throw HttpTransportError("Failed to initialize CURL");
  }
}

CurlHttpTransport::~CurlHttpTransport() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

size_t CurlHttpTransport::write_callback(void *contents,
                                         size_t size,
                                         size_t nmemb,
                                         std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

HttpResponse CurlHttpTransport::post_json(const std::string &url,
                                          const std::vector<std::string> &headers,
                                          const std::string &body) {
  HttpResponse response;

  struct curl_slist *header_list = curl_slist_append(nullptr, "Content-Type: application/json");
  for (const auto &header : headers) {
    header_list = curl_slist_append(header_list, header.c_str());
  }

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, header_list);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT, timeout_seconds_);
  curl_easy_setopt(curl_handle_, CURLOPT_NOSIGNAL, 1L);

  CURLcode res = curl_easy_perform(curl_handle_);
  curl_slist_free_all(header_list);
  if (res != CURLE_OK) {
    throw HttpTransportError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &response.status_code);
  return response;
}

}  // namespace ragdesk_core
