#include "cordon/codec.h"
#include "cordon/json_mini.h"

#include <json-c/json.h>

namespace cordon {

using json_mini::Doc;
using json_mini::new_string;

namespace {

void add(json_object* o, const char* k, json_object* v) { json_object_object_add(o, k, v); }

std::string dump(json_object* o) {
    std::string s = json_mini::to_string(o);
    json_object_put(o);
    return s;
}

bool fail(std::string* err, const std::string& msg) {
    if (err) *err = msg;
    return false;
}

// Optional typed fields: absent is fine, present with the wrong type is not.
bool opt_string(json_object* o, const char* k, std::string* out, std::string* err) {
    bool present = false;
    if (json_mini::get_string(o, k, out, &present) || !present) return true;
    return fail(err, std::string("field '") + k + "' must be a string");
}

bool opt_int(json_object* o, const char* k, int64_t* out, std::string* err) {
    bool present = false;
    if (json_mini::get_int(o, k, out, &present) || !present) return true;
    return fail(err, std::string("field '") + k + "' must be an integer");
}

bool opt_bool(json_object* o, const char* k, bool* out, std::string* err) {
    bool present = false;
    if (json_mini::get_bool(o, k, out, &present) || !present) return true;
    return fail(err, std::string("field '") + k + "' must be a boolean");
}

bool req_string(json_object* o, const char* k, std::string* out, std::string* err) {
    bool present = false;
    if (json_mini::get_string(o, k, out, &present)) return true;
    if (!present) return fail(err, std::string("missing field '") + k + "'");
    return fail(err, std::string("field '") + k + "' must be a string");
}

int clamp_int(int64_t v) {
    if (v > 0x7fffffff) return 0x7fffffff;
    if (v < -0x7fffffff) return -0x7fffffff;
    return (int)v;
}

LimitHit limithit_from_str(const std::string& s) {
    for (LimitHit h : {LimitHit::WALL_CLOCK, LimitHit::CPU_TIME, LimitHit::MEMORY, LimitHit::OUTPUT, LimitHit::CANCELLED}) {
        if (s == limithit_to_str(h)) return h;
    }
    return LimitHit::NONE;
}

} // namespace

// ---- ExecutionRequest ----

std::string encode_request(const ExecutionRequest& req) {
    json_object* o = json_object_new_object();
    add(o, "code", new_string(req.code));
    add(o, "stdin", new_string(req.stdin_data));
    if (req.timeout_ms > 0) add(o, "timeout_ms", json_object_new_int(req.timeout_ms));
    if (!req.echo_prompt) add(o, "echo_prompt", json_object_new_boolean(0));
    if (!req.request_id.empty()) add(o, "request_id", new_string(req.request_id));
    return dump(o);
}

bool decode_request_object(json_object* o, ExecutionRequest* out, std::string* err) {
    if (!json_mini::is_object(o)) return fail(err, "request must be a JSON object");
    ExecutionRequest r;
    if (!req_string(o, "code", &r.code, err)) return false;
    if (!opt_string(o, "stdin", &r.stdin_data, err)) return false;
    int64_t timeout = 0;
    if (!opt_int(o, "timeout_ms", &timeout, err)) return false;
    r.timeout_ms = clamp_int(timeout);
    if (!opt_bool(o, "echo_prompt", &r.echo_prompt, err)) return false;
    if (!opt_string(o, "request_id", &r.request_id, err)) return false;
    *out = std::move(r);
    return true;
}

bool decode_request(const std::string& json, ExecutionRequest* out, std::string* err) {
    Doc d = json_mini::parse(json);
    if (!d) return fail(err, "malformed JSON");
    return decode_request_object(d.root, out, err);
}

// ---- ExecutionResult ----

json_object* result_to_json(const ExecutionResult& r) {
    json_object* o = json_object_new_object();
    add(o, "status", json_object_new_string(outcome_to_str(r.status)));
    add(o, "stdout", new_string(r.stdout_text));
    add(o, "stderr", new_string(r.stderr_text));
    add(o, "duration_ms", json_object_new_int64(r.duration_ms));
    if (r.status != Outcome::SUCCESS) add(o, "message", new_string(r.message));
    add(o, "limit", json_object_new_string(limithit_to_str(r.limit)));
    add(o, "cpu_ms", json_object_new_int64(r.cpu_ms));
    add(o, "max_rss_kb", json_object_new_int64(r.max_rss_kb));
    add(o, "truncated", json_object_new_boolean(r.truncated ? 1 : 0));
    return o;
}

std::string encode_result(const ExecutionResult& r) { return dump(result_to_json(r)); }

bool decode_result(const std::string& json, ExecutionResult* out, std::string* err) {
    Doc d = json_mini::parse(json);
    if (!d || !json_mini::is_object(d.root)) return fail(err, "malformed JSON");
    ExecutionResult r;
    std::string status;
    if (!req_string(d.root, "status", &status, err)) return false;
    auto kind = outcome_from_str(status);
    if (!kind) return fail(err, "unknown status '" + status + "'");
    r.status = *kind;
    if (!req_string(d.root, "stdout", &r.stdout_text, err)) return false;
    if (!req_string(d.root, "stderr", &r.stderr_text, err)) return false;
    if (!opt_int(d.root, "duration_ms", &r.duration_ms, err)) return false;
    if (!opt_string(d.root, "message", &r.message, err)) return false;
    std::string limit;
    if (!opt_string(d.root, "limit", &limit, err)) return false;
    r.limit = limithit_from_str(limit);
    if (!opt_int(d.root, "cpu_ms", &r.cpu_ms, err)) return false;
    if (!opt_int(d.root, "max_rss_kb", &r.max_rss_kb, err)) return false;
    if (!opt_bool(d.root, "truncated", &r.truncated, err)) return false;
    *out = std::move(r);
    return true;
}

// ---- cell protocol ----

std::string encode_cell_request(const CellRequest& req) {
    json_object* o = json_object_new_object();
    add(o, "code", new_string(req.code));
    add(o, "stdin", new_string(req.stdin_data));
    add(o, "echo_prompt", json_object_new_boolean(req.echo_prompt ? 1 : 0));
    add(o, "max_call_depth", json_object_new_int(req.max_call_depth));
    add(o, "seccomp", json_object_new_boolean(req.seccomp ? 1 : 0));
    add(o, "seccomp_required", json_object_new_boolean(req.seccomp_required ? 1 : 0));
    return dump(o);
}

bool decode_cell_request(const std::string& json, CellRequest* out, std::string* err) {
    Doc d = json_mini::parse(json);
    if (!d || !json_mini::is_object(d.root)) return fail(err, "malformed cell request");
    CellRequest r;
    if (!req_string(d.root, "code", &r.code, err)) return false;
    if (!opt_string(d.root, "stdin", &r.stdin_data, err)) return false;
    if (!opt_bool(d.root, "echo_prompt", &r.echo_prompt, err)) return false;
    int64_t depth = r.max_call_depth;
    if (!opt_int(d.root, "max_call_depth", &depth, err)) return false;
    r.max_call_depth = clamp_int(depth);
    if (!opt_bool(d.root, "seccomp", &r.seccomp, err)) return false;
    if (!opt_bool(d.root, "seccomp_required", &r.seccomp_required, err)) return false;
    *out = std::move(r);
    return true;
}

std::string encode_cell_status(const script::ScriptOutcome& st) {
    json_object* o = json_object_new_object();
    add(o, "kind", json_object_new_string(script::runkind_to_str(st.kind)));
    add(o, "error_type", new_string(st.error_type));
    add(o, "message", new_string(st.message));
    add(o, "line", json_object_new_int(st.line));
    return dump(o);
}

bool decode_cell_status(const std::string& json, script::ScriptOutcome* out, std::string* err) {
    // the status channel carries exactly one line
    std::string line = json;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
    if (line.empty()) return fail(err, "empty cell status");
    if (line.find('\n') != std::string::npos) return fail(err, "more than one cell status line");
    Doc d = json_mini::parse(line);
    if (!d || !json_mini::is_object(d.root)) return fail(err, "malformed cell status");
    script::ScriptOutcome st;
    std::string kind;
    if (!req_string(d.root, "kind", &kind, err)) return false;
    if (!script::runkind_from_str(kind, &st.kind)) return fail(err, "unknown cell status kind '" + kind + "'");
    if (!opt_string(d.root, "error_type", &st.error_type, err)) return false;
    if (!opt_string(d.root, "message", &st.message, err)) return false;
    int64_t ln = 0;
    if (!opt_int(d.root, "line", &ln, err)) return false;
    st.line = clamp_int(ln);
    *out = std::move(st);
    return true;
}

// ---- grading ----

bool decode_test_cases(json_object* arr, std::vector<TestCase>* out, std::string* err) {
    if (!arr || !json_object_is_type(arr, json_type_array)) return fail(err, "test_cases must be an array");
    std::vector<TestCase> cases;
    const size_t n = json_object_array_length(arr);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (!json_mini::is_object(el)) return fail(err, "test case " + std::to_string(i) + " must be an object");
        TestCase tc;
        if (!opt_string(el, "input", &tc.input, err)) return false;
        if (!req_string(el, "expected", &tc.expected, err)) return false;
        cases.push_back(std::move(tc));
    }
    *out = std::move(cases);
    return true;
}

bool decode_test_cases(const std::string& json, std::vector<TestCase>* out, std::string* err) {
    Doc d = json_mini::parse(json);
    if (!d) return fail(err, "malformed JSON");
    json_object* arr = d.root;
    // also accept {"test_cases": [...]}
    if (json_mini::is_object(arr)) arr = json_mini::get_field(arr, "test_cases");
    return decode_test_cases(arr, out, err);
}

std::string encode_grade_report(const GradeReport& rep) {
    json_object* o = json_object_new_object();
    add(o, "passed", json_object_new_int(rep.passed));
    add(o, "total", json_object_new_int(rep.total));
    add(o, "score", json_object_new_int(rep.score));
    json_object* arr = json_object_new_array();
    for (const auto& c : rep.cases) {
        json_object* e = json_object_new_object();
        add(e, "input", new_string(c.input));
        add(e, "expected", new_string(c.expected));
        add(e, "actual", new_string(c.actual));
        add(e, "status", json_object_new_string(outcome_to_str(c.status)));
        add(e, "passed", json_object_new_boolean(c.passed ? 1 : 0));
        add(e, "message", new_string(c.message));
        json_object_array_add(arr, e);
    }
    add(o, "results", arr);
    return dump(o);
}

} // namespace cordon
