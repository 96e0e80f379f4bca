#ifndef INCLUDE_PYSANDBOX_UTILS_H_
#define INCLUDE_PYSANDBOX_UTILS_H_

#include <string>

#include "execution.h"
#include "policy.h"

long GetUniqueRequestId();

const char* ErrorKindName(ErrorKind);
ErrorCategory ErrorKindCategory(ErrorKind);
const char* ErrorCategoryName(ErrorCategory);
int ErrorCategoryStatus(ErrorCategory);

const char* IsolationToolName(IsolationTool);
// return false if the name is unknown
bool GetIsolationTool(const std::string&, IsolationTool&);

#endif  // INCLUDE_PYSANDBOX_UTILS_H_
