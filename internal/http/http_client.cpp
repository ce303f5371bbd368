#include "internal/http/http_client.hpp"

#include <cctype>

namespace routine::http {

std::string QueryEscape(const std::string& text) {
  static const char* kHex = "0123456789ABCDEF";

  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0f]);
    }
  }
  return out;
}

std::string JoinUrl(const std::string& base, const std::string& path) {
  std::string trimmed = base;
  while (!trimmed.empty() && trimmed.back() == '/') {
    trimmed.pop_back();
  }
  return trimmed + path;
}

} // namespace routine::http
