#include "cordon/script/outcome.h"

namespace cordon::script {

const char* runkind_to_str(RunKind k) {
    switch (k) {
        case RunKind::OK: return "ok";
        case RunKind::SYNTAX_ERROR: return "syntax_error";
        case RunKind::SECURITY_VIOLATION: return "security_violation";
        case RunKind::RUNTIME_FAULT: return "runtime_fault";
        case RunKind::MEMORY: return "memory";
        case RunKind::INTERNAL: return "internal";
    }
    return "internal";
}

bool runkind_from_str(const std::string& s, RunKind* out) {
    static const RunKind all[] = {RunKind::OK, RunKind::SYNTAX_ERROR, RunKind::SECURITY_VIOLATION,
                                  RunKind::RUNTIME_FAULT, RunKind::MEMORY, RunKind::INTERNAL};
    for (RunKind k : all) {
        if (s == runkind_to_str(k)) {
            *out = k;
            return true;
        }
    }
    return false;
}

std::string fault_line(const ScriptOutcome& oc) {
    std::string s = oc.error_type;
    if (!oc.message.empty()) s += ": " + oc.message;
    if (oc.line > 0) s += " (line " + std::to_string(oc.line) + ")";
    return s;
}

} // namespace cordon::script
