#include "server_io.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <pysandbox/execution.h>
#include <pysandbox/utils.h>
#include "http_utils.h"

namespace {

void HandleExecute(const IsolationPolicy& policy, const httplib::Request& req, httplib::Response& res) {
  std::string script, message;
  ExecutionOutcome outcome;
  if (!ParseExecuteBody(req.body, script, message)) {
    outcome = ExecutionOutcome::Error(ErrorKind::VALIDATION, message);
  } else {
    outcome = Execute(ExecutionRequest(std::move(script)), policy);
  }
  http_utils::SetJson(res, ErrorCategoryStatus(outcome.Category()), outcome.ToJson());
}

} // namespace

bool ParseExecuteBody(const std::string& body, std::string& script, std::string& message) {
  auto data = nlohmann::json::parse(body, nullptr, false);
  if (data.is_discarded() || !data.is_object()) {
    message = "request body must be a JSON object";
    return false;
  }
  auto it = data.find("script");
  if (it == data.end() || !it->is_string()) {
    message = "field 'script' must be a string";
    return false;
  }
  script = it->get<std::string>();
  return ValidateScript(script, message);
}

void SetupServer(httplib::Server& svr, const IsolationPolicy& policy, size_t threads) {
  svr.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
  svr.set_logger(http_utils::LogRequest);

  svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
    http_utils::SetJson(res, 200, {{"status", "ok"}});
  });
  svr.Post("/execute", [&policy](const httplib::Request& req, httplib::Response& res) {
    HandleExecute(policy, req, res);
  });
}

bool ServeForever(const IsolationPolicy& policy, const ServiceConfig& service) {
  httplib::Server svr;
  SetupServer(svr, policy, service.http_threads);
  spdlog::info("Listening on {}:{} with {} worker threads",
      service.listen_host, service.listen_port, service.http_threads);
  if (!svr.listen(service.listen_host.c_str(), service.listen_port)) {
    spdlog::error("Cannot listen on {}:{}", service.listen_host, service.listen_port);
    return false;
  }
  return true;
}
