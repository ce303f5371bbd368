#pragma once

#include <string>
#include <vector>

namespace routine::http {

struct HttpResponse {
  long        status = 0;
  std::string body;

  bool ok() const {
    return status >= 200 && status < 300;
  }
};

// One form part; an empty filename sends a plain field.
struct MultipartPart {
  std::string name;
  std::string filename;
  std::string content_type;
  std::string data;
};

/*
  Minimal blocking HTTP client used by the connectors.

  Transport failures (DNS, refused, timeout) throw util::ConnectorError;
  any HTTP status is returned to the caller.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual HttpResponse Get(const std::string& url, const std::vector<std::string>& headers) = 0;

  virtual HttpResponse PostJson(const std::string& url, const std::string& body, const std::vector<std::string>& headers) = 0;

  virtual HttpResponse PostMultipart(const std::string& url, const std::vector<MultipartPart>& parts, const std::vector<std::string>& headers) = 0;
};

// Percent-encodes everything except RFC 3986 unreserved characters.
std::string QueryEscape(const std::string& text);

// base without trailing '/' + path
std::string JoinUrl(const std::string& base, const std::string& path);

} // namespace routine::http
