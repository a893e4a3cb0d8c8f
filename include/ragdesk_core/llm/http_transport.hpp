#pragma once

#include <curl/curl.h>

#include <string>
#include <vector>

namespace ragdesk_core {

struct HttpResponse {
  long status_code = 0;
  std::string body;
};

// The request never produced an HTTP response (DNS, connect, TLS, timeout)
class HttpTransportError : public std::exception {
 public:
  explicit HttpTransportError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  // POSTs a JSON body. Any HTTP status is returned, only transport failures throw.
  virtual HttpResponse post_json(const std::string &url,
                                 const std::vector<std::string> &headers,
                                 const std::string &body) = 0;
};

class CurlHttpTransport : public HttpTransport {
 public:
  explicit CurlHttpTransport(long timeout_seconds = 60);
  ~CurlHttpTransport() override;

  // Disable copy constructor and assignment
  CurlHttpTransport(const CurlHttpTransport &) = delete;
  CurlHttpTransport &operator=(const CurlHttpTransport &) = delete;

  HttpResponse post_json(const std::string &url,
                         const std::vector<std::string> &headers,
                         const std::string &body) override;

 private:
  CURL *curl_handle_;
  long timeout_seconds_;

  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace ragdesk_core
