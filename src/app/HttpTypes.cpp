#include "app/HttpTypes.hpp"

#include <cctype>

namespace App {
namespace {
int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}
}  // namespace

std::string urlDecode(const std::string& text, bool plusIsSpace) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '%' && i + 2 < text.size()) {
      int hi = hexValue(text[i + 1]);
      int lo = hexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>(hi * 16 + lo);
        i += 2;
        continue;
      }
    }
    out += (c == '+' && plusIsSpace) ? ' ' : c;
  }
  return out;
}

std::map<std::string, std::string> parseFormEncoded(const std::string& text) {
  std::map<std::string, std::string> fields;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('&', start);
    if (end == std::string::npos) end = text.size();
    std::string pair = text.substr(start, end - start);
    if (!pair.empty()) {
      size_t eq = pair.find('=');
      std::string key = urlDecode(pair.substr(0, eq), true);
      std::string value = eq == std::string::npos ? "" : urlDecode(pair.substr(eq + 1), true);
      fields[key] = value;
    }
    start = end + 1;
  }
  return fields;
}

void splitTarget(const std::string& target, std::string& path,
                 std::map<std::string, std::string>& query) {
  size_t mark = target.find('?');
  path = urlDecode(target.substr(0, mark), false);
  query.clear();
  if (mark != std::string::npos) query = parseFormEncoded(target.substr(mark + 1));
}

}  // namespace App
