#include "test_common.h"
#include "cordon/grader.h"
#include "cordon/log.h"

#include <atomic>

using namespace cordon;

// Echoes stdin back as stdout, or fails when the code says so.
static ExecutionResult fake_exec(const ExecutionRequest& req, const CancelToken*) {
    ExecutionResult r;
    if (req.code == "crash") {
        r.status = Outcome::RUNTIME_FAULT;
        r.message = "ValueError: nope (line 1)";
        return r;
    }
    r.status = Outcome::SUCCESS;
    r.stdout_text = req.echo_prompt ? "prompt> " + req.stdin_data : req.stdin_data;
    return r;
}

int main() {
    set_log_level(LogLevel::ERROR);

    // Normalization
    expect_eq_str(normalize_output("a  \nb\t\n\n\n"), "a\nb", "trailing spaces and blank lines");
    expect_eq_str(normalize_output("  lead\r\n"), "  lead", "leading spaces kept, CR stripped");
    expect_eq_str(normalize_output("a\n\nb\n"), "a\n\nb", "inner blank lines kept");
    expect_eq_str(normalize_output(""), "", "empty");

    // Score
    expect_eq_ll(grade_score(0, 0), 0, "no cases scores 0");
    expect_eq_ll(grade_score(2, 3), 66, "integer percent truncates");
    expect_eq_ll(grade_score(3, 3), 100, "all pass");

    EngineConfig cfg;
    cfg.workers = 2;
    cfg.queue_capacity = 4;
    Dispatcher d(cfg, fake_exec);

    // Prompt echo is off while grading; whitespace differences forgiven
    {
        std::vector<TestCase> cases = {{"even\n", "even"}, {"odd  \n\n", "odd"}, {"odd", "even"}};
        GradeReport rep;
        expect_true(run_test_cases(d, "echo", cases, &rep) == DispatchStatus::OK, "grade ok");
        expect_eq_ll(rep.total, 3, "total");
        expect_eq_ll(rep.passed, 2, "passed");
        expect_eq_ll(rep.score, 66, "score");
        expect_true(rep.cases[0].passed && rep.cases[1].passed && !rep.cases[2].passed, "per-case verdicts");
        expect_eq_str(rep.cases[1].actual, "odd  \n\n", "actual output is raw");
    }

    // A failing run never passes even when output matches
    {
        std::vector<TestCase> cases = {{"", ""}};
        GradeReport rep;
        expect_true(run_test_cases(d, "crash", cases, &rep) == DispatchStatus::OK, "grade ok");
        expect_true(!rep.cases[0].passed, "fault fails the case");
        expect_true(rep.cases[0].status == Outcome::RUNTIME_FAULT, "status recorded");
        expect_eq_str(rep.cases[0].message, "ValueError: nope (line 1)", "message recorded");
    }

    // Empty case list
    {
        GradeReport rep;
        expect_true(run_test_cases(d, "echo", {}, &rep) == DispatchStatus::OK, "empty ok");
        expect_eq_ll(rep.total, 0, "zero total");
        expect_eq_ll(rep.score, 0, "zero score");
    }

    // Dispatcher rejections surface
    {
        std::vector<TestCase> cases = {{"x", "x"}};
        GradeReport rep;
        expect_true(run_test_cases(d, "", cases, &rep) == DispatchStatus::INVALID, "empty code invalid");
        d.shutdown();
        expect_true(run_test_cases(d, "echo", cases, &rep) == DispatchStatus::SHUTDOWN, "after shutdown");
    }

    std::cerr << "test_grader: ALL PASSED" << std::endl;
    return 0;
}
