#pragma once

#include "cordon/config.h"

#include <string>

namespace cordon {

void set_env_if_missing(const char* key, const std::string& value);

// Whole file contents. Throws std::runtime_error when unreadable.
std::string slurp(const std::string& path);

// Strict decimal int. False on junk or overflow.
bool parse_int_arg(const std::string& s, int* out);

// Profile defaults, CORDON_* environment and log level. The cell binary
// defaults to cordon_cell beside the running executable.
EngineConfig load_engine_config(const char* argv0);

} // namespace cordon
