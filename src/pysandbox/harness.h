#ifndef HARNESS_H_
#define HARNESS_H_

#include <string>
#include <vector>
#include <filesystem>

// Diagnostic lines the harness writes on stderr, one per line:
//   @@PYSANDBOX/1 <TAG>[: <single-line message>]
// This vocabulary is what the classifier matches on. Bump the version in
// kDiagnosticPrefix whenever a tag is added, removed or changes meaning.
#define ENUM_HARNESS_TAG_ \
  X(STARTED) /* the interpreter is running the harness */ \
  X(SYNTAX_ERROR) \
  X(MISSING_ENTRYPOINT) \
  X(NOT_SERIALIZABLE) \
  X(RUNTIME_ERROR)
enum class HarnessTag {
#define X(name) name,
  ENUM_HARNESS_TAG_
#undef X
};

extern const char kDiagnosticPrefix[];

struct HarnessDiagnostic {
  HarnessTag tag;
  std::string message;
};

const char* HarnessTagName(HarnessTag);
std::string FormatDiagnostic(HarnessTag, const std::string& message = "");
// false if the line is not a diagnostic of the current version
bool ParseDiagnostic(const std::string& line, HarnessDiagnostic&);

struct HarnessedScript {
  std::string harness_source;
  std::string script_source;
};

// The user script is kept in its own file and compiled by the harness, so
// that line numbers in tracebacks match what the caller submitted.
HarnessedScript BuildHarness(const std::string& script);

// argv for running the harness; all paths as seen by the interpreter
std::vector<std::string> HarnessCommand(
    const std::filesystem::path& interpreter, const std::filesystem::path& code_dir,
    const std::filesystem::path& result_channel);

#endif  // HARNESS_H_
