#include "cordon/types.h"

namespace cordon {

const char* outcome_to_str(Outcome o) {
    switch (o) {
        case Outcome::SUCCESS: return "Success";
        case Outcome::SYNTAX_ERROR: return "SyntaxError";
        case Outcome::RUNTIME_FAULT: return "RuntimeFault";
        case Outcome::TIMEOUT: return "Timeout";
        case Outcome::RESOURCE_EXCEEDED: return "ResourceExceeded";
        case Outcome::SECURITY_VIOLATION: return "SecurityViolation";
        case Outcome::INTERNAL_ERROR: return "InternalError";
    }
    return "InternalError";
}

std::optional<Outcome> outcome_from_str(const std::string& s) {
    if (s == "Success") return Outcome::SUCCESS;
    if (s == "SyntaxError") return Outcome::SYNTAX_ERROR;
    if (s == "RuntimeFault") return Outcome::RUNTIME_FAULT;
    if (s == "Timeout") return Outcome::TIMEOUT;
    if (s == "ResourceExceeded") return Outcome::RESOURCE_EXCEEDED;
    if (s == "SecurityViolation") return Outcome::SECURITY_VIOLATION;
    if (s == "InternalError") return Outcome::INTERNAL_ERROR;
    return std::nullopt;
}

const char* limithit_to_str(LimitHit h) {
    switch (h) {
        case LimitHit::NONE: return "none";
        case LimitHit::WALL_CLOCK: return "wall_clock";
        case LimitHit::CPU_TIME: return "cpu_time";
        case LimitHit::MEMORY: return "memory";
        case LimitHit::OUTPUT: return "output";
        case LimitHit::CANCELLED: return "cancelled";
    }
    return "none";
}

} // namespace cordon
