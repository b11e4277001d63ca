#include "cordon/limits.h"

namespace cordon {

namespace {
// CPU budget above the wall clock when no explicit CPU ceiling is set, so the
// watchdog reports a busy loop as a timeout before RLIMIT_CPU fires.
constexpr int kCpuHeadroomMs = 1000;
} // namespace

ResourceLimits limits_for(const EngineConfig& cfg, int requested_timeout_ms) {
    ResourceLimits lim;
    lim.timeout_ms = cfg.effective_timeout_ms(requested_timeout_ms);
    lim.cpu_ms = cfg.cpu_ms > 0 ? cfg.cpu_ms : lim.timeout_ms + kCpuHeadroomMs;
    lim.memory_mb = cfg.memory_mb;
    lim.stdout_max_bytes = cfg.stdout_max_bytes;
    lim.stderr_max_bytes = cfg.stderr_max_bytes;
    return lim;
}

long cpu_rlimit_seconds(int cpu_ms) {
    if (cpu_ms <= 0) return 1;
    return (cpu_ms + 999) / 1000;
}

} // namespace cordon
