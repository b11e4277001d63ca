#include "cordon/runner.h"
#include "cordon/classifier.h"
#include "cordon/codec.h"
#include "cordon/limits.h"
#include "cordon/log.h"
#include "cordon/proc.h"

#include <climits>
#include <unistd.h>

namespace cordon {

std::string default_cell_path() {
    char buf[PATH_MAX];
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return "";
    std::string self(buf, (size_t)n);
    size_t slash = self.rfind('/');
    if (slash == std::string::npos) return "";
    return self.substr(0, slash + 1) + "cordon_cell";
}

IsolatedRunner::IsolatedRunner(EngineConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.cell_bin.empty()) cfg_.cell_bin = default_cell_path();
}

ExecutionResult IsolatedRunner::run(const ExecutionRequest& req, const CancelToken* cancel) const {
    ResourceLimits lim = limits_for(cfg_, req.timeout_ms);

    CellRequest cell;
    cell.code = req.code;
    cell.stdin_data = req.stdin_data;
    cell.echo_prompt = req.echo_prompt;
    cell.max_call_depth = cfg_.max_call_depth;
    cell.seccomp = cfg_.seccomp;
    cell.seccomp_required = cfg_.seccomp_required;

    RunRecord rec;
    if (!run_cell(cfg_.cell_bin, encode_cell_request(cell), lim, cancel, &rec) && rec.error.empty()) {
        rec.error = "run_cell failed";
    }
    ExecutionResult r = classify_run(rec, lim.timeout_ms);
    log_line(LogLevel::DEBUG, "runner",
             "request=" + req.request_id + " status=" + outcome_to_str(r.status) +
             " duration_ms=" + std::to_string(r.duration_ms) + " cpu_ms=" + std::to_string(r.cpu_ms));
    return r;
}

} // namespace cordon
