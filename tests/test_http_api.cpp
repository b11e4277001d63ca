#include "test_common.h"
#include "cordon/http_api.h"
#include "cordon/codec.h"
#include "cordon/json_mini.h"
#include "cordon/log.h"

#include <chrono>
#include <future>
#include <thread>

using namespace cordon;

static ExecutionResult fake_exec(const ExecutionRequest& req, const CancelToken*) {
    if (req.code == "slow") std::this_thread::sleep_for(std::chrono::milliseconds(300));
    ExecutionResult r;
    r.status = Outcome::SUCCESS;
    r.stdout_text = req.stdin_data;
    return r;
}

int main() {
    set_log_level(LogLevel::ERROR);
    EngineConfig cfg;
    cfg.workers = 1;
    cfg.queue_capacity = 0;
    Dispatcher d(cfg, fake_exec);

    // health and unknown routes
    {
        HttpResponse r = route_request(d, "GET", "/health", "");
        expect_eq_ll(r.code, 200, "health");
        expect_eq_str(r.body, "{\"ok\":true}", "health body");
        expect_eq_ll(route_request(d, "GET", "/nope", "").code, 404, "404");
        expect_eq_ll(route_request(d, "GET", "/api/code/execute", "").code, 405, "GET execute not allowed");
    }

    // execute
    {
        HttpResponse r = route_request(d, "POST", "/api/code/execute", "{\"code\":\"print(1)\",\"stdin\":\"out\"}");
        expect_eq_ll(r.code, 200, "execute ok");
        ExecutionResult res;
        std::string err;
        expect_true(decode_result(r.body, &res, &err), "result decodes: " + err);
        expect_true(res.status == Outcome::SUCCESS && res.stdout_text == "out", "result fields");

        expect_eq_ll(route_request(d, "POST", "/api/code/execute", "not json").code, 400, "malformed body");
        expect_eq_ll(route_request(d, "POST", "/api/code/execute", "{\"stdin\":\"x\"}").code, 400, "missing code");
        expect_eq_ll(route_request(d, "POST", "/api/code/execute", "{\"code\":\"\"}").code, 400, "empty code");
        std::string huge = "{\"code\":\"" + std::string(kMaxHttpBodyBytes, 'x') + "\"}";
        expect_eq_ll(route_request(d, "POST", "/api/code/execute", huge).code, 413, "body cap");
    }

    // busy: the only worker is occupied and the queue holds nothing
    {
        auto first = std::async(std::launch::async, [&] {
            return route_request(d, "POST", "/api/code/execute", "{\"code\":\"slow\"}");
        });
        bool saw_busy = false;
        for (int i = 0; i < 100 && !saw_busy; i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            if (d.stats().in_flight == 1) {
                saw_busy = route_request(d, "POST", "/api/code/execute", "{\"code\":\"print(2)\"}").code == 503;
            }
        }
        expect_true(saw_busy, "second request rejected with 503");
        expect_eq_ll(first.get().code, 200, "first request completes");
    }

    // grade
    {
        HttpResponse r = route_request(d, "POST", "/api/code/grade",
                                       "{\"code\":\"echo\",\"test_cases\":[{\"input\":\"a\",\"expected\":\"a\"},{\"input\":\"b\",\"expected\":\"c\"}]}");
        expect_eq_ll(r.code, 200, "grade ok");
        json_mini::Doc doc = json_mini::parse(r.body);
        int64_t passed = -1, total = -1, score = -1;
        expect_true(json_mini::get_int(doc.root, "passed", &passed) && passed == 1, "passed");
        expect_true(json_mini::get_int(doc.root, "total", &total) && total == 2, "total");
        expect_true(json_mini::get_int(doc.root, "score", &score) && score == 50, "score");
        expect_eq_ll(route_request(d, "POST", "/api/code/grade", "{\"code\":\"x\"}").code, 400, "test_cases required");
    }

    // stats and metrics
    {
        HttpResponse r = route_request(d, "GET", "/stats", "");
        json_mini::Doc doc = json_mini::parse(r.body);
        int64_t completed = 0, busy = 0;
        expect_true(json_mini::get_int(doc.root, "completed", &completed) && completed >= 4, "completed count");
        expect_true(json_mini::get_int(doc.root, "rejected_busy", &busy) && busy >= 1, "busy count");
        json_object* by = json_mini::get_field(doc.root, "by_status");
        int64_t success = 0;
        expect_true(json_mini::get_int(by, "Success", &success) && success == completed, "per-kind counts");

        HttpResponse m = route_request(d, "GET", "/metrics", "");
        expect_true(m.content_type.rfind("text/plain", 0) == 0, "metrics content type");
        expect_true(m.body.find("cordon_executions_total{status=\"Success\"}") != std::string::npos, "metrics body");
    }

    d.shutdown();
    expect_eq_ll(route_request(d, "POST", "/api/code/execute", "{\"code\":\"x\"}").code, 503, "503 after shutdown");

    std::cerr << "test_http_api: ALL PASSED" << std::endl;
    return 0;
}
