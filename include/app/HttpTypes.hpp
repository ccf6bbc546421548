#pragma once

#include <map>
#include <string>

namespace App {

struct HttpRequest {
  std::string method;  // GET, POST, ...
  std::string path;    // decoded, without the query string
  std::map<std::string, std::string> query;
  std::string body;
  std::string contentType;
};

struct HttpResponse {
  int status = 200;
  std::string contentType = "application/json";
  std::string body;
  std::string location;  // set for redirects
};

std::string urlDecode(const std::string& text, bool plusIsSpace);
// application/x-www-form-urlencoded and query strings.
std::map<std::string, std::string> parseFormEncoded(const std::string& text);
// Splits "/path?a=1&b=2" into path and query.
void splitTarget(const std::string& target, std::string& path,
                 std::map<std::string, std::string>& query);

}  // namespace App
