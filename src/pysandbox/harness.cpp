#include "harness.h"

#include <fmt/format.h>

#include "paths.h"

const char kDiagnosticPrefix[] = "@@PYSANDBOX/1 ";

namespace {

static const char* kHarnessTagNameTable[] = {
#define X(name) #name,
  ENUM_HARNESS_TAG_
#undef X
};

// {prefix} is the only substitution; literal braces are doubled
constexpr char kHarnessTemplate[] = R"PY(import json
import os
import sys
import traceback

_PREFIX = {prefix}
# what a 64-bit JSON reader takes without losing digits
_INT_MIN = -(2 ** 63)
_INT_MAX = 2 ** 64 - 1


def _flush():
    for stream in (sys.stdout, sys.__stdout__, sys.stderr):
        try:
            stream.flush()
        except Exception:
            pass


def _report(tag, message=""):
    _flush()
    line = _PREFIX + tag
    if message:
        line += ": " + " ".join(str(message).split())
    # own line even if user output left a partial one on stderr
    sys.__stderr__.write("\n" + line + "\n")
    sys.__stderr__.flush()


def _describe(exc):
    try:
        text = str(exc)
    except Exception:
        text = ""
    name = type(exc).__name__
    return name + ": " + text if text else name


def _check_range(value):
    stack = [value]
    while stack:
        item = stack.pop()
        if isinstance(item, dict):
            stack.extend(item.values())
        elif isinstance(item, (list, tuple)):
            stack.extend(item)
        elif isinstance(item, int) and not isinstance(item, bool):
            if item < _INT_MIN or item > _INT_MAX:
                raise ValueError("integer does not fit in 64 bits")


def _fail(tag, exc=None, message=None):
    if exc is not None:
        try:
            traceback.print_exception(type(exc), exc, exc.__traceback__, file=sys.__stderr__)
        except Exception:
            pass
    _report(tag, message if message is not None else _describe(exc))
    os._exit(1)


def _run(script_path, channel_path):
    _report("STARTED")
    try:
        with open(script_path, encoding="utf-8") as f:
            source = f.read()
        code = compile(source, "<script>", "exec")
    except (SyntaxError, ValueError) as exc:
        _fail("SYNTAX_ERROR", exc)

    namespace = {{"__name__": "__sandbox__", "__builtins__": __builtins__}}
    try:
        exec(code, namespace)
    except BaseException as exc:
        _fail("RUNTIME_ERROR", exc)

    entry = namespace.get("main")
    if entry is None:
        _fail("MISSING_ENTRYPOINT", message="script does not define a function named 'main'")
    if not callable(entry):
        _fail("MISSING_ENTRYPOINT",
              message="'main' is not callable (found " + type(entry).__name__ + ")")

    try:
        value = entry()
    except BaseException as exc:
        _fail("RUNTIME_ERROR", exc)

    try:
        payload = json.dumps(value, allow_nan=False)
        _check_range(value)
    except (TypeError, ValueError, RecursionError) as exc:
        _fail("NOT_SERIALIZABLE",
              message="return value of 'main' is not JSON serializable: " + _describe(exc))

    _flush()
    try:
        temp_path = channel_path + ".tmp"
        with open(temp_path, "w", encoding="utf-8") as f:
            f.write(payload)
        os.replace(temp_path, channel_path)
    except BaseException as exc:
        _fail("RUNTIME_ERROR", exc,
              message="failed to write the return value: " + _describe(exc))
    os._exit(0)


if len(sys.argv) != 3:
    _report("RUNTIME_ERROR", "harness expects <script> <result channel>")
    os._exit(2)
_run(sys.argv[1], sys.argv[2])
)PY";

// Python string literal; the prefix is plain ASCII without quotes
std::string PythonLiteral(const std::string& str) {
  return "\"" + str + "\"";
}

} // namespace

const char* HarnessTagName(HarnessTag tag) {
  return kHarnessTagNameTable[(int)tag];
}

std::string FormatDiagnostic(HarnessTag tag, const std::string& message) {
  std::string ret = std::string(kDiagnosticPrefix) + HarnessTagName(tag);
  if (!message.empty()) ret += ": " + message;
  return ret;
}

bool ParseDiagnostic(const std::string& line, HarnessDiagnostic& diag) {
  static const std::string kPrefix = kDiagnosticPrefix;
  if (line.compare(0, kPrefix.size(), kPrefix) != 0) return false;
  std::string rest = line.substr(kPrefix.size());
  if (!rest.empty() && rest.back() == '\r') rest.pop_back();
  size_t colon = rest.find(": ");
  std::string name = rest.substr(0, colon);
  for (size_t i = 0; i < sizeof(kHarnessTagNameTable) / sizeof(kHarnessTagNameTable[0]); i++) {
    if (name != kHarnessTagNameTable[i]) continue;
    diag.tag = (HarnessTag)i;
    diag.message = colon == std::string::npos ? "" : rest.substr(colon + 2);
    return true;
  }
  return false;
}

HarnessedScript BuildHarness(const std::string& script) {
  HarnessedScript ret;
  ret.harness_source = fmt::format(fmt::runtime(kHarnessTemplate), fmt::arg("prefix", PythonLiteral(kDiagnosticPrefix)));
  ret.script_source = script;
  return ret;
}

std::vector<std::string> HarnessCommand(
    const std::filesystem::path& interpreter, const std::filesystem::path& code_dir,
    const std::filesystem::path& result_channel) {
  // -u: prints reach the pipe immediately, so output before a kill survives
  // -B: the code directory is read-only
  // -I: ignore PYTHON* variables and the user site directory
  return {
    interpreter.string(), "-u", "-B", "-I",
    (code_dir / kHarnessName).string(),
    (code_dir / kScriptName).string(),
    result_channel.string(),
  };
}
