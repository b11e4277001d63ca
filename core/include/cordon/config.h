#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace cordon {

enum class Profile { DEV, PROD };

// Detect profile from CORDON_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: debug logging, seccomp best-effort, generous timeouts
// PROD: info logging, seccomp required, tight timeouts
void apply_profile_defaults(Profile p);

// Env helpers. Unset or unparsable values yield defv.
int64_t getenv_i64(const char* key, int64_t defv);
int getenv_int(const char* key, int defv);
bool getenv_bool(const char* key, bool defv);
std::string getenv_str(const char* key, const std::string& defv);

struct EngineConfig {
    int workers{4};
    size_t queue_capacity{16};

    int default_timeout_ms{5000};
    int max_timeout_ms{10000};
    int cpu_ms{0};                  // 0 = derived from the effective timeout
    size_t memory_mb{256};
    size_t stdout_max_bytes{64 * 1024};
    size_t stderr_max_bytes{16 * 1024};
    int max_call_depth{200};

    std::string cell_bin;           // path to cordon_cell
    bool seccomp{true};
    bool seccomp_required{false};

    std::string log_level{"info"};
    std::string event_log_path;     // empty = no JSONL event log

    // Read CORDON_* variables on top of the defaults above. Values are clamped.
    static EngineConfig from_env();

    // Effective wall-clock timeout for a request override (0 = default).
    int effective_timeout_ms(int requested_ms) const;
};

} // namespace cordon
