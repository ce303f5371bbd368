#include "internal/http/curl_http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

#include "internal/util/errors.hpp"

namespace routine::http {
namespace {

struct EasyDeleter {
  void operator()(CURL* curl) const {
    curl_easy_cleanup(curl);
  }
};

struct HeaderListDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

struct MimeDeleter {
  void operator()(curl_mime* mime) const {
    curl_mime_free(mime);
  }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;
using MimeHandle = std::unique_ptr<curl_mime, MimeDeleter>;

size_t WriteBody(char* data, size_t size, size_t count, void* user) {
  static_cast<std::string*>(user)->append(data, size * count);
  return size * count;
}

void GlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw util::ConnectorError("curl_global_init failed");
    }
  });
}

EasyHandle NewHandle(const std::string& url, std::chrono::milliseconds timeout, std::string* body) {
  EasyHandle curl(curl_easy_init());
  if (!curl) {
    throw util::ConnectorError("curl_easy_init failed");
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, body);
  return curl;
}

HeaderList BuildHeaders(const std::vector<std::string>& headers, const char* extra = nullptr) {
  curl_slist* list = nullptr;
  for (const auto& header : headers) {
    list = curl_slist_append(list, header.c_str());
  }
  if (extra) {
    list = curl_slist_append(list, extra);
  }
  return HeaderList(list);
}

HttpResponse Perform(CURL* curl, const std::string& url, std::string* body) {
  CURLcode rc = curl_easy_perform(curl);
  if (rc != CURLE_OK) {
    throw util::ConnectorError("request to " + url + " failed: " + curl_easy_strerror(rc));
  }

  HttpResponse response;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  response.body = std::move(*body);
  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient(std::chrono::milliseconds timeout) : timeout_(timeout) {
  GlobalInit();
}

HttpResponse CurlHttpClient::Get(const std::string& url, const std::vector<std::string>& headers) {
  std::string body;
  auto        curl = NewHandle(url, timeout_, &body);
  auto        list = BuildHeaders(headers);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);

  return Perform(curl.get(), url, &body);
}

HttpResponse CurlHttpClient::PostJson(const std::string& url, const std::string& payload, const std::vector<std::string>& headers) {
  std::string body;
  auto        curl = NewHandle(url, timeout_, &body);
  auto        list = BuildHeaders(headers, "Content-Type: application/json");
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));

  return Perform(curl.get(), url, &body);
}

HttpResponse CurlHttpClient::PostMultipart(const std::string& url, const std::vector<MultipartPart>& parts, const std::vector<std::string>& headers) {
  std::string body;
  auto        curl = NewHandle(url, timeout_, &body);
  auto        list = BuildHeaders(headers);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());

  MimeHandle mime(curl_mime_init(curl.get()));
  for (const auto& part : parts) {
    curl_mimepart* field = curl_mime_addpart(mime.get());
    curl_mime_name(field, part.name.c_str());
    curl_mime_data(field, part.data.data(), part.data.size());
    if (!part.filename.empty()) {
      curl_mime_filename(field, part.filename.c_str());
    }
    if (!part.content_type.empty()) {
      curl_mime_type(field, part.content_type.c_str());
    }
  }
  curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());

  return Perform(curl.get(), url, &body);
}

} // namespace routine::http
