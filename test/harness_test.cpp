#include <gtest/gtest.h>

#include "harness.h"
#include "paths.h"

TEST(Harness, TemplateIsFilled) {
  HarnessedScript harnessed = BuildHarness("def main():\n    return 1\n");
  EXPECT_EQ(harnessed.script_source, "def main():\n    return 1\n");
  EXPECT_NE(harnessed.harness_source.find("_PREFIX = \"@@PYSANDBOX/1 \""), std::string::npos);
  EXPECT_EQ(harnessed.harness_source.find("{prefix}"), std::string::npos);
  EXPECT_NE(harnessed.harness_source.find("{\"__name__\": \"__sandbox__\""), std::string::npos);
  // the user script is never pasted into the harness
  EXPECT_EQ(harnessed.harness_source.find("return 1"), std::string::npos);
}

TEST(Harness, Command) {
  auto cmd = HarnessCommand("/usr/bin/python3", "/sandbox", "/tmp/.pysandbox_result.json");
  std::vector<std::string> expect = {
    "/usr/bin/python3", "-u", "-B", "-I",
    "/sandbox/harness.py", "/sandbox/script.py", "/tmp/.pysandbox_result.json",
  };
  EXPECT_EQ(cmd, expect);
}

TEST(Harness, ParseDiagnostic) {
  HarnessDiagnostic diag;
  ASSERT_TRUE(ParseDiagnostic("@@PYSANDBOX/1 STARTED", diag));
  EXPECT_EQ(diag.tag, HarnessTag::STARTED);
  EXPECT_EQ(diag.message, "");

  ASSERT_TRUE(ParseDiagnostic("@@PYSANDBOX/1 SYNTAX_ERROR: SyntaxError: invalid syntax (<script>, line 1)\r", diag));
  EXPECT_EQ(diag.tag, HarnessTag::SYNTAX_ERROR);
  EXPECT_EQ(diag.message, "SyntaxError: invalid syntax (<script>, line 1)");

  ASSERT_TRUE(ParseDiagnostic("@@PYSANDBOX/1 RUNTIME_ERROR: KeyError: 'a: b'", diag));
  EXPECT_EQ(diag.tag, HarnessTag::RUNTIME_ERROR);
  EXPECT_EQ(diag.message, "KeyError: 'a: b'");
}

TEST(Harness, RejectForeignLines) {
  HarnessDiagnostic diag;
  EXPECT_FALSE(ParseDiagnostic("Traceback (most recent call last):", diag));
  EXPECT_FALSE(ParseDiagnostic("@@PYSANDBOX/0 STARTED", diag));
  EXPECT_FALSE(ParseDiagnostic("@@PYSANDBOX/1 SOMETHING_ELSE: x", diag));
  EXPECT_FALSE(ParseDiagnostic(" @@PYSANDBOX/1 STARTED", diag));
  EXPECT_FALSE(ParseDiagnostic("@@PYSANDBOX/1 STARTEDX", diag));
}

TEST(Harness, FormatMatchesParse) {
  HarnessDiagnostic diag;
  ASSERT_TRUE(ParseDiagnostic(FormatDiagnostic(HarnessTag::NOT_SERIALIZABLE, "set is not JSON serializable"), diag));
  EXPECT_EQ(diag.tag, HarnessTag::NOT_SERIALIZABLE);
  EXPECT_EQ(diag.message, "set is not JSON serializable");
  EXPECT_STREQ(HarnessTagName(HarnessTag::MISSING_ENTRYPOINT), "MISSING_ENTRYPOINT");
}
