#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <string>
#include <httplib.h>
#include <pysandbox/policy.h>

// body must be {"script": "<non-blank string>", ...}
bool ParseExecuteBody(const std::string& body, std::string& script, std::string& message);

// GET  /         -> {"status": "ok"}
// POST /execute  {"script": "..."} -> outcome JSON, status by error category
//
// Each request is executed synchronously on one of `threads` worker threads.
// policy must outlive svr.
void SetupServer(httplib::Server& svr, const IsolationPolicy& policy, size_t threads);

// Returns false if the server could not listen.
bool ServeForever(const IsolationPolicy& policy, const ServiceConfig& service);

#endif  // SERVER_IO_H_
