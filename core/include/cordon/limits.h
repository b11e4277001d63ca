#pragma once
#include "cordon/config.h"
#include "cordon/types.h"

#include <cstddef>

namespace cordon {

// Ceilings applied to one cell run.
struct ResourceLimits {
    int timeout_ms{5000};               // wall clock
    int cpu_ms{5000};                   // CPU time (user + system)
    size_t memory_mb{256};              // address space
    size_t stdout_max_bytes{64 * 1024};
    size_t stderr_max_bytes{16 * 1024};
    size_t status_max_bytes{64 * 1024}; // cell status channel
    int rlimit_nofile{8};
    int rlimit_nproc{1};
    int poll_slice_ms{10};              // watchdog granularity
};

// Limits for a request under `cfg`. `requested_timeout_ms` <= 0 means default.
ResourceLimits limits_for(const EngineConfig& cfg, int requested_timeout_ms);

// Whole seconds for RLIMIT_CPU, rounded up, at least 1.
long cpu_rlimit_seconds(int cpu_ms);

// Records the first ceiling hit by a run. Later hits are ignored.
class LimitTracker {
public:
    void hit(LimitHit h) {
        if (first_ == LimitHit::NONE) first_ = h;
    }
    LimitHit first() const { return first_; }
    bool any() const { return first_ != LimitHit::NONE; }

private:
    LimitHit first_{LimitHit::NONE};
};

} // namespace cordon
