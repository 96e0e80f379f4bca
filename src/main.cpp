#include <unistd.h>
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <pysandbox/execution.h>
#include <pysandbox/logger.h>
#include <pysandbox/policy.h>
#include <pysandbox/utils.h>
#include "server_io.h"

namespace fs = std::filesystem;

namespace {

struct Options {
  IsolationPolicy policy;
  ServiceConfig service;
  std::string script_file;
};

Options ParseArgs(int argc, char** argv) {
  Options ret;
  IsolationPolicy& policy = ret.policy;
  ServiceConfig& service = ret.service;
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "pysandbox");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/pysandbox.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--script")
    .help("Run this script once, print the outcome as JSON and exit");
  parser.add_argument("--host")
    .help("Address to listen on");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("-t", "--timeout")
    .scan<'d', long>()
    .help("Wall-clock timeout per script in seconds");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!LoadPolicy(config_file, policy, service)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present("--host")) service.listen_host = val.value();
  if (auto val = parser.present<int>("--port")) service.listen_port = val.value();
  if (auto val = parser.present<long>("--timeout")) policy.wall_clock_timeout_seconds = val.value();
  if (auto val = parser.present("--script")) ret.script_file = val.value();

  std::string message;
  if (!ValidatePolicy(policy, message)) {
    spdlog::error("Invalid isolation policy: {}", message);
    exit(1);
  }
  return ret;
}

int RunOnce(const fs::path& path, const IsolationPolicy& policy) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) {
    spdlog::error("Cannot read script {}", path.c_str());
    return 1;
  }
  std::stringstream buf;
  buf << fin.rdbuf();
  ExecutionOutcome outcome = Execute(ExecutionRequest(buf.str()), policy);
  std::cout << outcome.ToJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  return outcome.Success() ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  const Options opts = ParseArgs(argc, argv);
  const IsolationPolicy& policy = opts.policy;
  if (policy.tool == IsolationTool::NONE) {
    spdlog::warn("Isolation tool is \"none\": scripts run without namespaces. Use for development only.");
  } else if (geteuid() != 0) {
    spdlog::warn("Not running as root; {} may fail to set up the jail", IsolationToolName(policy.tool));
  }
  if (!opts.script_file.empty()) return RunOnce(opts.script_file, policy);
  return ServeForever(policy, opts.service) ? 0 : 1;
}
