#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cordon {

// Outcome kind of one execution. Closed set.
enum class Outcome {
    SUCCESS,
    SYNTAX_ERROR,
    RUNTIME_FAULT,
    TIMEOUT,
    RESOURCE_EXCEEDED,
    SECURITY_VIOLATION,
    INTERNAL_ERROR,
};

// First ceiling a run hit.
enum class LimitHit {
    NONE,
    WALL_CLOCK,
    CPU_TIME,
    MEMORY,
    OUTPUT,
    CANCELLED,
};

const char* outcome_to_str(Outcome o);
std::optional<Outcome> outcome_from_str(const std::string& s);
const char* limithit_to_str(LimitHit h);

struct ExecutionRequest {
    std::string code;
    std::string stdin_data;
    int timeout_ms{0};          // 0 = server default
    bool echo_prompt{true};     // input("prompt") writes the prompt to stdout
    std::string request_id;     // tracing only
};

struct ExecutionResult {
    Outcome status{Outcome::INTERNAL_ERROR};
    std::string stdout_text;
    std::string stderr_text;
    int64_t duration_ms{0};
    std::string message;        // empty on SUCCESS

    LimitHit limit{LimitHit::NONE};
    int64_t cpu_ms{0};
    int64_t max_rss_kb{0};
    bool truncated{false};
};

// Request document the host writes to a cell's stdin.
struct CellRequest {
    std::string code;
    std::string stdin_data;
    bool echo_prompt{true};
    int max_call_depth{200};
    bool seccomp{true};
    bool seccomp_required{false};
};

struct TestCase {
    std::string input;
    std::string expected;
};

struct CaseResult {
    std::string input;
    std::string expected;
    std::string actual;
    Outcome status{Outcome::INTERNAL_ERROR};
    bool passed{false};
    std::string message;
};

struct GradeReport {
    int passed{0};
    int total{0};
    int score{0};               // integer percent
    std::vector<CaseResult> cases;
};

// Caller-driven cancellation. Shared between the submitter and the watchdog.
struct CancelToken {
    std::atomic<bool> cancelled{false};

    void cancel() { cancelled.store(true); }
    bool is_cancelled() const { return cancelled.load(); }
};

} // namespace cordon
