#include "test_common.h"
#include "cordon/classifier.h"
#include "cordon/codec.h"
#include "cordon/log.h"

#include <csignal>

using namespace cordon;

static RunRecord exited_with(script::RunKind kind, const std::string& type = "", const std::string& msg = "", int line = 0) {
    RunRecord rec;
    rec.spawned = true;
    rec.exited = true;
    rec.exit_code = 0;
    script::ScriptOutcome st;
    st.kind = kind;
    st.error_type = type;
    st.message = msg;
    st.line = line;
    rec.status_text = encode_cell_status(st) + "\n";
    return rec;
}

int main() {
    set_log_level(LogLevel::ERROR);

    // Success keeps output and has no message
    {
        RunRecord rec = exited_with(script::RunKind::OK);
        rec.stdout_text = "hi\n";
        rec.duration_ms = 12;
        ExecutionResult r = classify_run(rec, 5000);
        expect_true(r.status == Outcome::SUCCESS, "success");
        expect_eq_str(r.stdout_text, "hi\n", "stdout kept");
        expect_eq_str(r.message, "", "no message on success");
        expect_eq_ll(r.duration_ms, 12, "duration kept");
    }

    // Program faults
    {
        ExecutionResult r = classify_run(exited_with(script::RunKind::RUNTIME_FAULT, "ZeroDivisionError", "division by zero", 3), 5000);
        expect_true(r.status == Outcome::RUNTIME_FAULT, "runtime fault");
        expect_eq_str(r.message, "ZeroDivisionError: division by zero (line 3)", "fault message");

        r = classify_run(exited_with(script::RunKind::SYNTAX_ERROR, "SyntaxError", "invalid syntax", 1), 5000);
        expect_true(r.status == Outcome::SYNTAX_ERROR, "syntax error");
        expect_eq_str(r.message, "SyntaxError: invalid syntax (line 1)", "syntax message");
    }

    // Security beats everything, including a ceiling hit
    {
        RunRecord rec = exited_with(script::RunKind::SECURITY_VIOLATION, "CapabilityDenied", "capability 'os' not permitted", 1);
        rec.limit = LimitHit::WALL_CLOCK;
        ExecutionResult r = classify_run(rec, 5000);
        expect_true(r.status == Outcome::SECURITY_VIOLATION, "violation first");
        expect_eq_str(r.message, "capability 'os' not permitted", "violation message");

        RunRecord sys;
        sys.spawned = true;
        sys.exited = true;
        sys.term_signal = SIGSYS;
        r = classify_run(sys, 5000);
        expect_true(r.status == Outcome::SECURITY_VIOLATION, "SIGSYS is a violation");
        expect_eq_str(r.message, "blocked system call", "SIGSYS message");
    }

    // Ceilings
    {
        RunRecord rec;
        rec.spawned = true;
        rec.exited = true;
        rec.term_signal = SIGKILL;
        rec.limit = LimitHit::WALL_CLOCK;
        rec.stdout_text = "partial";
        ExecutionResult r = classify_run(rec, 1500);
        expect_true(r.status == Outcome::TIMEOUT, "wall clock is timeout");
        expect_eq_str(r.message, "execution exceeded 1500ms", "timeout message");
        expect_eq_str(r.stdout_text, "partial", "partial output kept");

        rec.limit = LimitHit::CANCELLED;
        r = classify_run(rec, 1500);
        expect_true(r.status == Outcome::TIMEOUT && r.message == "execution cancelled", "cancel is timeout");

        rec.limit = LimitHit::OUTPUT;
        rec.truncated = true;
        r = classify_run(rec, 1500);
        expect_true(r.status == Outcome::RESOURCE_EXCEEDED, "output ceiling");
        expect_eq_str(r.message, "output limit exceeded", "output message");
        expect_true(r.truncated, "truncated flag");

        RunRecord cpu;
        cpu.spawned = true;
        cpu.exited = true;
        cpu.term_signal = SIGXCPU;
        r = classify_run(cpu, 1500);
        expect_true(r.status == Outcome::RESOURCE_EXCEEDED && r.limit == LimitHit::CPU_TIME, "SIGXCPU is cpu ceiling");
        expect_eq_str(r.message, "cpu time limit exceeded", "cpu message");

        r = classify_run(exited_with(script::RunKind::MEMORY, "MemoryError"), 1500);
        expect_true(r.status == Outcome::RESOURCE_EXCEEDED && r.limit == LimitHit::MEMORY, "memory status");
        expect_eq_str(r.message, "memory limit exceeded", "memory message");
    }

    // Unexplained failures are internal with a generic message
    {
        RunRecord rec;
        rec.spawned = false;
        rec.error = "execve: No such file or directory";
        ExecutionResult r = classify_run(rec, 5000);
        expect_true(r.status == Outcome::INTERNAL_ERROR, "spawn failure");
        expect_eq_str(r.message, "internal error", "generic message");

        RunRecord crash;
        crash.spawned = true;
        crash.exited = true;
        crash.term_signal = SIGSEGV;
        crash.stdout_text = "leak";
        r = classify_run(crash, 5000);
        expect_true(r.status == Outcome::INTERNAL_ERROR, "crash without status");
        expect_eq_str(r.stdout_text, "", "no output on internal error");

        RunRecord junk = exited_with(script::RunKind::OK);
        junk.status_text = "{\"kind\":\"ok\"}\n{\"kind\":\"ok\"}\n";
        r = classify_run(junk, 5000);
        expect_true(r.status == Outcome::INTERNAL_ERROR, "two status lines rejected");

        RunRecord bad_exit = exited_with(script::RunKind::OK);
        bad_exit.exit_code = 3;
        r = classify_run(bad_exit, 5000);
        expect_true(r.status == Outcome::INTERNAL_ERROR, "ok status with non-zero exit");

        RunRecord overflow = exited_with(script::RunKind::OK);
        overflow.status_overflow = true;
        r = classify_run(overflow, 5000);
        expect_true(r.status == Outcome::INTERNAL_ERROR, "status overflow");
    }

    // Message sanitizing
    {
        expect_eq_str(sanitize_message("a\nb\tc\x01"), "a b c", "control characters removed");
        std::string longmsg(500, 'x');
        expect_eq_ll((long long)sanitize_message(longmsg).size(), (long long)kMaxMessageBytes, "capped");
        std::string utf(199, 'a');
        utf += "\xc3\xa9\xc3\xa9";
        std::string s = sanitize_message(utf);
        expect_eq_ll((long long)s.size(), 199, "cut on a UTF-8 boundary");
        ExecutionResult r = make_result(Outcome::SUCCESS, "ignored");
        expect_eq_str(r.message, "", "success never carries a message");
    }

    std::cerr << "test_classifier: ALL PASSED" << std::endl;
    return 0;
}
