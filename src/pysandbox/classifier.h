#ifndef CLASSIFIER_H_
#define CLASSIFIER_H_

#include <string>
#include <vector>

#include <pysandbox/execution.h>

#include "harness.h"
#include "supervisor.h"

// how much of stderr a runtime error message carries
constexpr size_t kStderrTailBytes = 2000;

struct DiagnosticScan {
  bool started;
  std::vector<HarnessDiagnostic> terminal; // in order of appearance
  std::string error_output; // stderr without diagnostic lines

  DiagnosticScan() : started(false) {}
};

DiagnosticScan ScanDiagnostics(const std::string& error_output);

// last max_bytes of text, starting at a line boundary where possible, trimmed
std::string StderrTail(const std::string& text, size_t max_bytes = kStderrTailBytes);

// Map a raw observation to exactly one result. Pure.
ExecutionOutcome Classify(const SandboxOutcome&);

#endif  // CLASSIFIER_H_
