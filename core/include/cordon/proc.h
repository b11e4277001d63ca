#pragma once

#include "cordon/limits.h"
#include "cordon/types.h"

#include <cstdint>
#include <string>

namespace cordon {

// Descriptor the cell writes its status line to.
constexpr int kCellStatusFd = 3;

// Raw record of one cell run, before classification.
struct RunRecord {
    bool spawned{false};
    std::string error;          // internal runner error, not child stderr

    bool exited{false};         // reaped
    int exit_code{-1};          // valid when WIFEXITED
    int term_signal{0};         // valid when WIFSIGNALED
    LimitHit limit{LimitHit::NONE};

    std::string stdout_text;
    std::string stderr_text;
    std::string status_text;    // fd 3 contents
    bool truncated{false};      // stdout or stderr hit its cap
    bool status_overflow{false};

    int64_t duration_ms{0};
    int64_t cpu_ms{0};
    int64_t max_rss_kb{0};
};

// Start `cell_bin` in a fresh process group with an empty environment, feed
// `request_doc` on its stdin, capture fd 1, 2 and 3 into bounded buffers and
// enforce every ceiling in `lim`. The process group is killed and reaped on
// every path. `cancel` may be null. Returns true if the process started.
bool run_cell(const std::string& cell_bin,
              const std::string& request_doc,
              const ResourceLimits& lim,
              const CancelToken* cancel,
              RunRecord* rec);

} // namespace cordon
