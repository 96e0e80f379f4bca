#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Log HTTP requests

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>

namespace http_utils {

std::string FormatOneParam(const httplib::Params&);
std::string FormatOneParam(const httplib::Headers&);

// access log line; 5xx at warn, the rest at info
void LogRequest(const httplib::Request&, const httplib::Response&);

void SetJson(httplib::Response&, int status, const nlohmann::json& body);

} // namespace http_utils

#endif  // HTTP_UTILS_H_
