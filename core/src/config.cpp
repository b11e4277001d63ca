#include "cordon/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace cordon {

Profile detect_profile() {
    const char* env = std::getenv("CORDON_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("CORDON_LOG_LEVEL",          "debug", NO_OVERWRITE);
            setenv("CORDON_SECCOMP_ENABLE",     "1",     NO_OVERWRITE);
            setenv("CORDON_SECCOMP_REQUIRED",   "0",     NO_OVERWRITE);
            setenv("CORDON_DEFAULT_TIMEOUT_MS", "5000",  NO_OVERWRITE);
            setenv("CORDON_MAX_TIMEOUT_MS",     "30000", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("CORDON_LOG_LEVEL",          "info",  NO_OVERWRITE);
            setenv("CORDON_SECCOMP_ENABLE",     "1",     NO_OVERWRITE);
            setenv("CORDON_SECCOMP_REQUIRED",   "1",     NO_OVERWRITE);
            setenv("CORDON_DEFAULT_TIMEOUT_MS", "3000",  NO_OVERWRITE);
            setenv("CORDON_MAX_TIMEOUT_MS",     "10000", NO_OVERWRITE);
            setenv("CORDON_MEMORY_MB",          "256",   NO_OVERWRITE);
            break;
    }
}

int64_t getenv_i64(const char* key, int64_t defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    char* end = nullptr;
    long long x = std::strtoll(v, &end, 10);
    if (end == v) return defv;
    return (int64_t)x;
}

int getenv_int(const char* key, int defv) {
    int64_t x = getenv_i64(key, defv);
    if (x > 0x7fffffff) return 0x7fffffff;
    if (x < -0x7fffffff) return -0x7fffffff;
    return (int)x;
}

bool getenv_bool(const char* key, bool defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return defv;
}

std::string getenv_str(const char* key, const std::string& defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    return v;
}

EngineConfig EngineConfig::from_env() {
    EngineConfig c;
    c.workers = std::clamp(getenv_int("CORDON_WORKERS", c.workers), 1, 64);
    c.queue_capacity = (size_t)std::clamp<int64_t>(getenv_i64("CORDON_QUEUE_CAPACITY", (int64_t)c.queue_capacity), 0, 4096);

    c.max_timeout_ms = std::clamp(getenv_int("CORDON_MAX_TIMEOUT_MS", c.max_timeout_ms), 100, 600000);
    c.default_timeout_ms = std::clamp(getenv_int("CORDON_DEFAULT_TIMEOUT_MS", c.default_timeout_ms), 50, c.max_timeout_ms);
    c.cpu_ms = std::clamp(getenv_int("CORDON_CPU_MS", c.cpu_ms), 0, 600000);
    c.memory_mb = (size_t)std::clamp<int64_t>(getenv_i64("CORDON_MEMORY_MB", (int64_t)c.memory_mb), 32, 16384);
    c.stdout_max_bytes = (size_t)std::clamp<int64_t>(getenv_i64("CORDON_STDOUT_MAX_BYTES", (int64_t)c.stdout_max_bytes), 256, 64LL * 1024 * 1024);
    c.stderr_max_bytes = (size_t)std::clamp<int64_t>(getenv_i64("CORDON_STDERR_MAX_BYTES", (int64_t)c.stderr_max_bytes), 256, 64LL * 1024 * 1024);
    c.max_call_depth = std::clamp(getenv_int("CORDON_MAX_CALL_DEPTH", c.max_call_depth), 16, 1000);

    c.cell_bin = getenv_str("CORDON_CELL_BIN", c.cell_bin);
    c.seccomp = getenv_bool("CORDON_SECCOMP_ENABLE", c.seccomp);
    c.seccomp_required = getenv_bool("CORDON_SECCOMP_REQUIRED", c.seccomp_required);

    c.log_level = getenv_str("CORDON_LOG_LEVEL", c.log_level);
    c.event_log_path = getenv_str("CORDON_EVENT_LOG", c.event_log_path);
    return c;
}

int EngineConfig::effective_timeout_ms(int requested_ms) const {
    if (requested_ms <= 0) return default_timeout_ms;
    return std::min(requested_ms, max_timeout_ms);
}

} // namespace cordon
