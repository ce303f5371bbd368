#pragma once

#include <chrono>

#include "internal/http/http_client.hpp"

namespace routine::http {

/*
  libcurl-backed client. Each request uses its own easy handle, so one
  instance is safe to share across trigger threads.
*/
class CurlHttpClient final : public HttpClient {
 public:
  explicit CurlHttpClient(std::chrono::milliseconds timeout);

  HttpResponse Get(const std::string& url, const std::vector<std::string>& headers) override;
  HttpResponse PostJson(const std::string& url, const std::string& body, const std::vector<std::string>& headers) override;
  HttpResponse PostMultipart(const std::string& url, const std::vector<MultipartPart>& parts, const std::vector<std::string>& headers) override;

 private:
  std::chrono::milliseconds timeout_;
};

} // namespace routine::http
