#include "http_utils.h"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace http_utils {

std::string FormatOneParam(const httplib::Params& params) {
  return fmt::format("{}", params);
}
std::string FormatOneParam(const httplib::Headers& headers) {
  auto it = headers.find("User-Agent");
  return it == headers.end() ? "-" : it->second;
}

void LogRequest(const httplib::Request& req, const httplib::Response& res) {
  auto level = res.status >= 500 ? spdlog::level::warn : spdlog::level::info;
  spdlog::log(level, "{} {} {} from {} ({}) params {} body {}B", req.method, req.path, res.status,
      req.remote_addr, FormatOneParam(req.headers), FormatOneParam(req.params), req.body.size());
}

void SetJson(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  // user output may hold invalid UTF-8
  res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

} // namespace http_utils
