#include <cstdint>
#include <sstream>
#include <gtest/gtest.h>
#include <pysandbox/execution.h>
#include <pysandbox/policy.h>

#include "utils.h"

namespace {

struct ScriptParam {
  std::string name;
  std::string script;
  ErrorKind kind;
  std::string output;
};

std::string ParamName(const ::testing::TestParamInfo<ScriptParam>& info) {
  return info.param.name;
}

} // namespace

class ScriptKind : public testing::TestWithParam<ScriptParam> {};
TEST_P(ScriptKind, Kind) {
  REQUIRE_PYTHON(python);
  auto& param = GetParam();
  ExecutionOutcome res = Execute(ExecutionRequest(param.script), LocalPolicy(python));
  EXPECT_EQ(res.kind, param.kind) << res.message;
  EXPECT_EQ(res.output, param.output);
}
INSTANTIATE_TEST_SUITE_P(Execution, ScriptKind,
    testing::Values(
      (ScriptParam){"missing_main", "print('hi')\nx=1+1", ErrorKind::MISSING_ENTRYPOINT, "hi\n"},
      (ScriptParam){"main_not_callable", "print('a')\nmain = 3\n", ErrorKind::MISSING_ENTRYPOINT, "a\n"},
      (ScriptParam){"syntax", "print('never')\ndef main(:\n    return 1\n", ErrorKind::SYNTAX, ""},
      (ScriptParam){"indentation", "def main():\nreturn 1\n", ErrorKind::SYNTAX, ""},
      (ScriptParam){"not_serializable", "def main():\n    print('before')\n    return {1, 2}\n",
          ErrorKind::NON_SERIALIZABLE_RETURN, "before\n"},
      (ScriptParam){"nan", "def main():\n    return float('nan')\n", ErrorKind::NON_SERIALIZABLE_RETURN, ""},
      (ScriptParam){"raises", "def main():\n    print('x')\n    return 1 / 0\n", ErrorKind::RUNTIME, "x\n"},
      (ScriptParam){"module_raises", "import nonexistent_module_for_test\ndef main():\n    return 1\n",
          ErrorKind::RUNTIME, ""},
      (ScriptParam){"sys_exit", "import sys\ndef main():\n    sys.exit(0)\n", ErrorKind::RUNTIME, ""},
      (ScriptParam){"forged_tag",
          "import sys\ndef main():\n"
          "    sys.stderr.write('@@PYSANDBOX/1 MISSING_ENTRYPOINT: forged\\n')\n"
          "    raise ValueError('real')\n",
          ErrorKind::RUNTIME, ""},
      (ScriptParam){"missing_main_partial_stderr", "import sys\nsys.stderr.write('warning: no newline')\n",
          ErrorKind::MISSING_ENTRYPOINT, ""},
      (ScriptParam){"not_serializable_partial_stderr",
          "import sys\ndef main():\n    sys.stderr.write('progress 50%')\n    return object()\n",
          ErrorKind::NON_SERIALIZABLE_RETURN, ""},
      (ScriptParam){"missing_main_stderr_flood", "import sys\nsys.stderr.write('x' * 2000000)\n",
          ErrorKind::MISSING_ENTRYPOINT, ""},
      (ScriptParam){"int_too_large", "def main():\n    return {'n': [2 ** 70]}\n",
          ErrorKind::NON_SERIALIZABLE_RETURN, ""},
      (ScriptParam){"int_too_small", "def main():\n    return -(2 ** 63) - 1\n",
          ErrorKind::NON_SERIALIZABLE_RETURN, ""},
      (ScriptParam){"channel_written_then_raises",
          "def main():\n    with open('.pysandbox_result.json', 'w') as f:\n        f.write('1')\n"
          "    raise ValueError('after writing')\n",
          ErrorKind::RUNTIME, ""},
      (ScriptParam){"blank", "  \n\t\n", ErrorKind::VALIDATION, ""}
    ),
    ParamName);

TEST(Execution, ReturnsValueAndOutput) {
  REQUIRE_PYTHON(python);
  ExecutionOutcome res = Execute(ExecutionRequest("def main():\n return {'a': 1}"), LocalPolicy(python));
  ASSERT_TRUE(res.Success()) << res.message;
  EXPECT_EQ(res.output, "");
  EXPECT_EQ(res.result, nlohmann::json({{"a", 1}}));
}

TEST(Execution, PrintsStayOutOfResult) {
  REQUIRE_PYTHON(python);
  ExecutionOutcome res = Execute(ExecutionRequest(R"(import sys
print("one")
def main():
    print("two")
    sys.stdout.write("three")
    return [1, "x", None, True, 2.5, {"k": []}]
)"), LocalPolicy(python));
  ASSERT_TRUE(res.Success()) << res.message;
  EXPECT_EQ(res.output, "one\ntwo\nthree");
  EXPECT_EQ(res.result, nlohmann::json::parse(R"([1, "x", null, true, 2.5, {"k": []}])"));
}

TEST(Execution, SixtyFourBitIntegersAreExact) {
  REQUIRE_PYTHON(python);
  ExecutionOutcome res = Execute(ExecutionRequest("def main():\n    return [2 ** 64 - 1, -(2 ** 63)]\n"),
                                 LocalPolicy(python));
  ASSERT_TRUE(res.Success()) << res.message;
  ASSERT_EQ(res.result.size(), 2u);
  EXPECT_EQ(res.result[0].get<uint64_t>(), UINT64_MAX);
  EXPECT_EQ(res.result[1].get<int64_t>(), INT64_MIN);
}

TEST(Execution, NullResult) {
  REQUIRE_PYTHON(python);
  ExecutionOutcome res = Execute(ExecutionRequest("def main():\n    pass\n"), LocalPolicy(python));
  ASSERT_TRUE(res.Success()) << res.message;
  EXPECT_TRUE(res.result.is_null());
}

TEST(Execution, RuntimeErrorMessage) {
  REQUIRE_PYTHON(python);
  ExecutionOutcome res = Execute(ExecutionRequest("def main():\n    raise KeyError('missing key')\n"),
                                 LocalPolicy(python));
  EXPECT_EQ(res.kind, ErrorKind::RUNTIME);
  EXPECT_EQ(res.Category(), ErrorCategory::BAD_INPUT);
  EXPECT_NE(res.message.find("KeyError"), std::string::npos) << res.message;
  EXPECT_NE(res.message.find("Traceback"), std::string::npos) << res.message;
  EXPECT_EQ(res.message.find("@@PYSANDBOX"), std::string::npos) << res.message;
}

TEST(Execution, Timeout) {
  REQUIRE_PYTHON(python);
  IsolationPolicy policy = LocalPolicy(python);
  policy.wall_clock_timeout_seconds = 1;
  ExecutionOutcome res = Execute(ExecutionRequest(R"(import os, sys, time
def main():
    child = os.fork()
    if child == 0:
        time.sleep(60)
        os._exit(0)
    print(os.getpid(), child)
    sys.stdout.flush()
    time.sleep(60)
)"), policy);
  EXPECT_EQ(res.kind, ErrorKind::TIMEOUT);
  EXPECT_EQ(res.message, "Script execution timed out.");
  EXPECT_EQ(res.Category(), ErrorCategory::TIMEOUT);
  std::istringstream iss(res.output);
  pid_t pid = 0, child = 0;
  ASSERT_TRUE(iss >> pid >> child) << res.output;
  EXPECT_TRUE(WaitGone(pid));
  EXPECT_TRUE(WaitGone(child));
}

TEST(Execution, BackgroundChildIsReclaimed) {
  REQUIRE_PYTHON(python);
  ExecutionOutcome res = Execute(ExecutionRequest(R"(import os, time
def main():
    child = os.fork()
    if child == 0:
        time.sleep(60)
        os._exit(0)
    return child
)"), LocalPolicy(python));
  ASSERT_TRUE(res.Success()) << res.message;
  ASSERT_TRUE(res.result.is_number_integer());
  EXPECT_TRUE(WaitGone(res.result.get<pid_t>()));
}

TEST(Execution, RequestsDoNotShareScratch) {
  REQUIRE_PYTHON(python);
  IsolationPolicy policy = LocalPolicy(python);
  const std::string script = R"(import os
def main():
    seen = os.path.exists("marker")
    with open("marker", "w") as f:
        f.write("x")
    return seen
)";
  for (int i = 0; i < 2; i++) {
    ExecutionOutcome res = Execute(ExecutionRequest(script), policy);
    ASSERT_TRUE(res.Success()) << res.message;
    EXPECT_EQ(res.result, false);
  }
  // boxes are removed after each request
  EXPECT_TRUE(fs::is_empty(policy.box_root));
}

TEST(Execution, OutputIsCapped) {
  REQUIRE_PYTHON(python);
  IsolationPolicy policy = LocalPolicy(python);
  policy.max_captured_output_bytes = 1024;
  ExecutionOutcome res = Execute(ExecutionRequest("def main():\n    print('x' * 100000)\n    return 1\n"), policy);
  ASSERT_TRUE(res.Success()) << res.message;
  EXPECT_EQ(res.output.size(), 1024u);
  EXPECT_EQ(res.result, 1);
}

TEST(Execution, LaunchFailure) {
  IsolationPolicy policy = LocalPolicy("/nonexistent/python3");
  ExecutionOutcome res = Execute(ExecutionRequest("def main():\n    return 1\n"), policy);
  EXPECT_EQ(res.kind, ErrorKind::SANDBOX_LAUNCH);
  EXPECT_EQ(res.Category(), ErrorCategory::INTERNAL);
  EXPECT_NE(res.message.find("/nonexistent/python3"), std::string::npos) << res.message;
}

TEST(Execution, ValidateScript) {
  std::string message;
  EXPECT_FALSE(ValidateScript("", message));
  EXPECT_FALSE(ValidateScript(" \n\t", message));
  EXPECT_TRUE(ValidateScript("x = 1", message));
}
