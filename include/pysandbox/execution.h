#ifndef INCLUDE_PYSANDBOX_EXECUTION_H_
#define INCLUDE_PYSANDBOX_EXECUTION_H_

#include <string>

#include <nlohmann/json.hpp>

class IsolationPolicy;

// caller-visible category; the HTTP layer maps it to a status code
#define ENUM_ERROR_CATEGORY_ \
  X(NONE, 200) \
  X(BAD_INPUT, 400) \
  X(TIMEOUT, 408) \
  X(INTERNAL, 500)
enum class ErrorCategory {
#define X(name, status) name,
  ENUM_ERROR_CATEGORY_
#undef X
};

#define ENUM_ERROR_KIND_ \
  X(NONE, "", NONE) \
  X(VALIDATION, "ValidationError", BAD_INPUT) \
  X(MISSING_ENTRYPOINT, "MissingEntrypointError", BAD_INPUT) \
  X(SYNTAX, "SyntaxError", BAD_INPUT) \
  X(NON_SERIALIZABLE_RETURN, "NonSerializableReturnError", BAD_INPUT) \
  X(RUNTIME, "RuntimeError", BAD_INPUT) \
  X(TIMEOUT, "TimeoutError", TIMEOUT) \
  X(SANDBOX_LAUNCH, "SandboxLaunchError", INTERNAL)
enum class ErrorKind {
#define X(name, type_name, category) name,
  ENUM_ERROR_KIND_
#undef X
};

struct ExecutionRequest {
  const std::string script;

  explicit ExecutionRequest(std::string script) : script(std::move(script)) {}
};

class ExecutionOutcome {
 public:
  // NONE on success
  ErrorKind kind;
  // captured standard output; kept on failure as well
  std::string output;
  // return value of main(); null unless kind == NONE
  nlohmann::json result;
  std::string message;

  ExecutionOutcome() : kind(ErrorKind::NONE) {}

  bool Success() const { return kind == ErrorKind::NONE; }
  ErrorCategory Category() const;
  // {"stdout", "result"} on success, {"error", "error_type", "stdout"} otherwise
  nlohmann::json ToJson() const;

  static ExecutionOutcome Ok(std::string output, nlohmann::json result);
  static ExecutionOutcome Error(ErrorKind kind, std::string message, std::string output = "");
};

// Run one script under the given policy. Blocks until the sandboxed process
// (and everything it spawned) is gone. Safe to call from several threads.
ExecutionOutcome Execute(const ExecutionRequest&, const IsolationPolicy&);

// Boundary validation for inbound requests; returns false with a message
// when the script is unusable (empty or blank).
bool ValidateScript(const std::string& script, std::string& message);

#endif  // INCLUDE_PYSANDBOX_EXECUTION_H_
