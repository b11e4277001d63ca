#include "cordon/http_api.h"
#include "cordon/codec.h"
#include "cordon/grader.h"
#include "cordon/json_mini.h"
#include "cordon/log.h"

#include <json-c/json.h>

#include <sstream>

namespace cordon {

namespace {

HttpResponse json_error(int code, const std::string& msg) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "ok", json_object_new_boolean(0));
    json_object_object_add(o, "error", json_mini::new_string(msg));
    HttpResponse r;
    r.code = code;
    r.body = json_mini::to_string(o);
    json_object_put(o);
    return r;
}

HttpResponse reject(DispatchStatus st) {
    switch (st) {
        case DispatchStatus::BUSY: return json_error(503, "server busy");
        case DispatchStatus::SHUTDOWN: return json_error(503, "shutting down");
        case DispatchStatus::INVALID: return json_error(400, "code must be a non-empty string");
        case DispatchStatus::OK: break;
    }
    return json_error(500, "internal error");
}

HttpResponse execute(Dispatcher& d, const std::string& body) {
    ExecutionRequest req;
    std::string err;
    if (!decode_request(body, &req, &err)) return json_error(400, err);
    ExecutionResult res;
    DispatchStatus st = d.submit(req, &res);
    if (st != DispatchStatus::OK) return reject(st);
    HttpResponse r;
    r.body = encode_result(res);
    return r;
}

HttpResponse grade(Dispatcher& d, const std::string& body) {
    json_mini::Doc doc = json_mini::parse(body);
    if (!doc || !json_mini::is_object(doc.root)) return json_error(400, "malformed JSON");
    std::string code;
    if (!json_mini::get_string(doc.root, "code", &code)) return json_error(400, "missing field 'code'");
    std::vector<TestCase> cases;
    std::string err;
    if (!decode_test_cases(json_mini::get_field(doc.root, "test_cases"), &cases, &err)) {
        return json_error(400, err);
    }
    GradeReport rep;
    DispatchStatus st = run_test_cases(d, code, cases, &rep);
    if (st != DispatchStatus::OK) return reject(st);
    HttpResponse r;
    r.body = encode_grade_report(rep);
    return r;
}

const Outcome kAllOutcomes[] = {
    Outcome::SUCCESS, Outcome::SYNTAX_ERROR, Outcome::RUNTIME_FAULT, Outcome::TIMEOUT,
    Outcome::RESOURCE_EXCEEDED, Outcome::SECURITY_VIOLATION, Outcome::INTERNAL_ERROR,
};

} // namespace

std::string encode_stats(const DispatchStats& s) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "submitted", json_object_new_int64((int64_t)s.submitted));
    json_object_object_add(o, "rejected_busy", json_object_new_int64((int64_t)s.rejected_busy));
    json_object_object_add(o, "rejected_invalid", json_object_new_int64((int64_t)s.rejected_invalid));
    json_object_object_add(o, "completed", json_object_new_int64((int64_t)s.completed));
    json_object_object_add(o, "in_flight", json_object_new_int64(s.in_flight));
    json_object_object_add(o, "queued", json_object_new_int64(s.queued));
    json_object_object_add(o, "workers", json_object_new_int(s.workers));
    json_object* by = json_object_new_object();
    for (Outcome k : kAllOutcomes) {
        json_object_object_add(by, outcome_to_str(k), json_object_new_int64((int64_t)s.by_outcome[(size_t)k]));
    }
    json_object_object_add(o, "by_status", by);
    std::string out = json_mini::to_string(o);
    json_object_put(o);
    return out;
}

std::string metrics_text(const DispatchStats& s) {
    std::ostringstream m;
    m << "# HELP cordon_requests_submitted_total Requests accepted by the dispatcher\n";
    m << "# TYPE cordon_requests_submitted_total counter\n";
    m << "cordon_requests_submitted_total " << s.submitted << "\n";
    m << "# HELP cordon_requests_rejected_total Requests rejected at admission\n";
    m << "# TYPE cordon_requests_rejected_total counter\n";
    m << "cordon_requests_rejected_total{reason=\"busy\"} " << s.rejected_busy << "\n";
    m << "cordon_requests_rejected_total{reason=\"invalid\"} " << s.rejected_invalid << "\n";
    m << "# HELP cordon_executions_total Completed executions by outcome\n";
    m << "# TYPE cordon_executions_total counter\n";
    for (Outcome k : kAllOutcomes) {
        m << "cordon_executions_total{status=\"" << outcome_to_str(k) << "\"} " << s.by_outcome[(size_t)k] << "\n";
    }
    m << "# HELP cordon_in_flight Executions currently running\n";
    m << "# TYPE cordon_in_flight gauge\n";
    m << "cordon_in_flight " << s.in_flight << "\n";
    m << "# HELP cordon_queued Requests waiting for a worker\n";
    m << "# TYPE cordon_queued gauge\n";
    m << "cordon_queued " << s.queued << "\n";
    m << "# HELP cordon_workers_configured Number of worker threads\n";
    m << "# TYPE cordon_workers_configured gauge\n";
    m << "cordon_workers_configured " << s.workers << "\n";
    return m.str();
}

HttpResponse route_request(Dispatcher& d, const std::string& method, const std::string& path,
                           const std::string& body) {
    if (method == "GET" && path == "/health") {
        HttpResponse r;
        r.body = "{\"ok\":true}";
        return r;
    }
    if (method == "GET" && path == "/stats") {
        HttpResponse r;
        r.body = encode_stats(d.stats());
        return r;
    }
    if (method == "GET" && path == "/metrics") {
        HttpResponse r;
        r.content_type = "text/plain; version=0.0.4; charset=utf-8";
        r.body = metrics_text(d.stats());
        return r;
    }
    if (path == "/api/code/execute" || path == "/api/code/grade") {
        if (method != "POST") return json_error(405, "method not allowed");
        if (body.size() > kMaxHttpBodyBytes) return json_error(413, "request body too large");
        return path == "/api/code/execute" ? execute(d, body) : grade(d, body);
    }
    log_line(LogLevel::DEBUG, "http", method + " " + path + " -> 404");
    return json_error(404, "not found");
}

} // namespace cordon
