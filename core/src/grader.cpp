#include "cordon/grader.h"

namespace cordon {

namespace {

bool is_trailing_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string normalize_output(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos <= s.size()) {
        size_t nl = s.find('\n', pos);
        size_t end = nl == std::string::npos ? s.size() : nl;
        size_t e = end;
        while (e > pos && is_trailing_space(s[e - 1])) e--;
        if (pos > 0) out += '\n';
        out.append(s, pos, e - pos);
        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    while (!out.empty() && out.back() == '\n') out.pop_back();
    return out;
}

int grade_score(int passed, int total) {
    if (total <= 0) return 0;
    return (int)((int64_t)passed * 100 / total);
}

DispatchStatus run_test_cases(Dispatcher& d, const std::string& code,
                              const std::vector<TestCase>& cases, GradeReport* out) {
    GradeReport rep;
    rep.total = (int)cases.size();
    for (size_t i = 0; i < cases.size(); i++) {
        const TestCase& tc = cases[i];
        ExecutionRequest req;
        req.code = code;
        req.stdin_data = tc.input;
        req.echo_prompt = false;
        req.request_id = "case-" + std::to_string(i);

        ExecutionResult r;
        DispatchStatus st = d.submit(req, &r);
        if (st != DispatchStatus::OK) return st;

        CaseResult cr;
        cr.input = tc.input;
        cr.expected = tc.expected;
        cr.actual = r.stdout_text;
        cr.status = r.status;
        cr.message = r.message;
        cr.passed = r.status == Outcome::SUCCESS &&
                    normalize_output(r.stdout_text) == normalize_output(tc.expected);
        if (cr.passed) rep.passed++;
        rep.cases.push_back(std::move(cr));
    }
    rep.score = grade_score(rep.passed, rep.total);
    if (out) *out = std::move(rep);
    return DispatchStatus::OK;
}

} // namespace cordon
