#pragma once

#include <string>

namespace cordon::script {

// Terminal status of one program run, as reported over the cell protocol.
enum class RunKind { OK, SYNTAX_ERROR, SECURITY_VIOLATION, RUNTIME_FAULT, MEMORY, INTERNAL };

const char* runkind_to_str(RunKind k);
bool runkind_from_str(const std::string& s, RunKind* out);

struct ScriptOutcome {
    RunKind kind{RunKind::OK};
    std::string error_type;
    std::string message;
    int line{0};
};

// `Type: message (line N)`, the single line written to stderr for a fault.
std::string fault_line(const ScriptOutcome& oc);

} // namespace cordon::script
