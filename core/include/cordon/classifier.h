#pragma once

#include "cordon/proc.h"
#include "cordon/types.h"

#include <string>

namespace cordon {

// Longest diagnostic message surfaced to callers, in bytes.
constexpr size_t kMaxMessageBytes = 200;

// Single line, control characters removed, cut at kMaxMessageBytes on a
// UTF-8 boundary.
std::string sanitize_message(const std::string& msg);

// Map a raw run record to exactly one outcome. Precedence:
// SecurityViolation > Timeout/ResourceExceeded > SyntaxError > RuntimeFault
// > Success; anything unexplained is InternalError. `timeout_ms` is the
// effective wall-clock ceiling of the run.
ExecutionResult classify_run(const RunRecord& rec, int timeout_ms);

// Result for a request that never reached a cell (cancelled while queued,
// spawn failure, ...).
ExecutionResult make_result(Outcome status, const std::string& message);

} // namespace cordon
