#pragma once

#include "cordon/config.h"
#include "cordon/types.h"

#include <string>

namespace cordon {

// Path of cordon_cell next to the running executable, or "" when unknown.
std::string default_cell_path();

// Runs one request in a fresh cell process under the configured ceilings and
// classifies the outcome. Stateless between calls; safe to share between
// worker threads.
class IsolatedRunner {
public:
    explicit IsolatedRunner(EngineConfig cfg);

    ExecutionResult run(const ExecutionRequest& req, const CancelToken* cancel) const;

    const EngineConfig& config() const { return cfg_; }

private:
    EngineConfig cfg_;
};

} // namespace cordon
