#include "runner_utils.h"

#include "cordon/log.h"
#include "cordon/runner.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cordon {

void set_env_if_missing(const char* key, const std::string& value) {
    if (std::getenv(key) != nullptr) return;
    setenv(key, value.c_str(), 0);
}

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss; ss << f.rdbuf();
    return ss.str();
}

bool parse_int_arg(const std::string& s, int* out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v < INT_MIN || v > INT_MAX) return false;
    *out = (int)v;
    return true;
}

EngineConfig load_engine_config(const char* argv0) {
    Profile p = detect_profile();
    apply_profile_defaults(p);

    EngineConfig cfg = EngineConfig::from_env();
    if (cfg.cell_bin.empty()) cfg.cell_bin = default_cell_path();
    if (cfg.cell_bin.empty() && argv0) {
        std::string self = argv0;
        size_t slash = self.rfind('/');
        cfg.cell_bin = slash == std::string::npos ? "cordon_cell" : self.substr(0, slash + 1) + "cordon_cell";
    }
    LogLevel lvl;
    if (loglevel_from_str(cfg.log_level, &lvl)) {
        set_log_level(lvl);
    } else {
        log_line(LogLevel::WARN, "config", "unknown log level '" + cfg.log_level + "', keeping " +
                 loglevel_to_str(log_level()));
    }
    log_line(LogLevel::DEBUG, "config", std::string("profile=") + profile_name(p) + " cell=" + cfg.cell_bin);
    return cfg;
}

} // namespace cordon
