#include "cordon/classifier.h"
#include "cordon/codec.h"
#include "cordon/log.h"

#include <algorithm>
#include <csignal>

namespace cordon {

namespace {

const char* kInternalMessage = "internal error";

std::string limit_message(LimitHit h, int timeout_ms) {
    switch (h) {
        case LimitHit::WALL_CLOCK: return "execution exceeded " + std::to_string(timeout_ms) + "ms";
        case LimitHit::CANCELLED: return "execution cancelled";
        case LimitHit::CPU_TIME: return "cpu time limit exceeded";
        case LimitHit::MEMORY: return "memory limit exceeded";
        case LimitHit::OUTPUT: return "output limit exceeded";
        case LimitHit::NONE: break;
    }
    return "";
}

ExecutionResult internal(const RunRecord& rec, const std::string& detail) {
    log_line(LogLevel::ERROR, "classifier", detail);
    ExecutionResult r = make_result(Outcome::INTERNAL_ERROR, kInternalMessage);
    r.duration_ms = rec.duration_ms;
    r.cpu_ms = rec.cpu_ms;
    r.max_rss_kb = rec.max_rss_kb;
    return r;
}

} // namespace

std::string sanitize_message(const std::string& msg) {
    std::string out;
    out.reserve(std::min(msg.size(), kMaxMessageBytes));
    for (char c : msg) {
        unsigned char u = (unsigned char)c;
        if (u == '\n' || u == '\r' || u == '\t') {
            if (!out.empty() && out.back() != ' ') out.push_back(' ');
            continue;
        }
        if (u < 0x20 || u == 0x7f) continue;
        out.push_back(c);
    }
    while (!out.empty() && out.back() == ' ') out.pop_back();
    if (out.size() > kMaxMessageBytes) {
        size_t cut = kMaxMessageBytes;
        while (cut > 0 && ((unsigned char)out[cut] & 0xC0) == 0x80) cut--;
        out.resize(cut);
    }
    return out;
}

ExecutionResult make_result(Outcome status, const std::string& message) {
    ExecutionResult r;
    r.status = status;
    if (status != Outcome::SUCCESS) r.message = sanitize_message(message);
    return r;
}

ExecutionResult classify_run(const RunRecord& rec, int timeout_ms) {
    if (!rec.spawned) return internal(rec, "cell spawn failed: " + rec.error);
    if (rec.status_overflow) return internal(rec, "cell status channel overflow");

    script::ScriptOutcome st;
    std::string status_err;
    const bool have_status = !rec.status_text.empty() && decode_cell_status(rec.status_text, &st, &status_err);

    ExecutionResult r;
    r.stdout_text = rec.stdout_text;
    r.stderr_text = rec.stderr_text;
    r.duration_ms = rec.duration_ms;
    r.cpu_ms = rec.cpu_ms;
    r.max_rss_kb = rec.max_rss_kb;
    r.truncated = rec.truncated;
    r.limit = rec.limit;

    auto finish = [&r](Outcome o, const std::string& msg) {
        r.status = o;
        r.message = o == Outcome::SUCCESS ? std::string() : sanitize_message(msg);
        log_line(LogLevel::DEBUG, "classifier", std::string("outcome ") + outcome_to_str(o));
        return r;
    };

    // 1. security
    if (have_status && st.kind == script::RunKind::SECURITY_VIOLATION) {
        return finish(Outcome::SECURITY_VIOLATION, st.message);
    }
    if (rec.term_signal == SIGSYS) return finish(Outcome::SECURITY_VIOLATION, "blocked system call");

    // 2. ceilings, first hit wins
    LimitHit limit = rec.limit;
    if (limit == LimitHit::NONE && have_status && st.kind == script::RunKind::MEMORY) limit = LimitHit::MEMORY;
    if (limit == LimitHit::NONE && rec.term_signal == SIGXCPU) limit = LimitHit::CPU_TIME;
    if (limit != LimitHit::NONE) {
        r.limit = limit;
        bool timeout = limit == LimitHit::WALL_CLOCK || limit == LimitHit::CANCELLED;
        return finish(timeout ? Outcome::TIMEOUT : Outcome::RESOURCE_EXCEEDED, limit_message(limit, timeout_ms));
    }

    if (!have_status) {
        r = ExecutionResult{};
        std::string detail = rec.status_text.empty() ? "cell exited without status" : "bad cell status: " + status_err;
        if (rec.term_signal) detail += " (signal " + std::to_string(rec.term_signal) + ")";
        else detail += " (exit " + std::to_string(rec.exit_code) + ")";
        return internal(rec, detail);
    }

    // 3-5. program outcomes
    switch (st.kind) {
        case script::RunKind::SYNTAX_ERROR:
            return finish(Outcome::SYNTAX_ERROR, script::fault_line(st));
        case script::RunKind::RUNTIME_FAULT:
            return finish(Outcome::RUNTIME_FAULT, script::fault_line(st));
        case script::RunKind::OK:
            if (rec.term_signal == 0 && rec.exit_code == 0) return finish(Outcome::SUCCESS, "");
            break;
        default:
            break;
    }
    r = ExecutionResult{};
    return internal(rec, "cell reported '" + std::string(script::runkind_to_str(st.kind)) + "': " + st.message +
                             " (exit " + std::to_string(rec.exit_code) + ", signal " + std::to_string(rec.term_signal) + ")");
}

} // namespace cordon
