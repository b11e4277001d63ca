#include "cmd_run.h"
#include "runner_utils.h"

#include "cordon/codec.h"
#include "cordon/dispatcher.h"
#include "cordon/grader.h"

#include <iostream>
#include <stdexcept>

using namespace cordon;

int cmd_run(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: cordon_cli run <program> [--stdin <file>] [--timeout <ms>]\n";
        return 2;
    }

    ExecutionRequest req;
    req.request_id = "cli";
    try {
        req.code = slurp(argv[2]);
        for (int i = 3; i < argc; i++) {
            std::string a = argv[i];
            if (a == "--stdin" && i + 1 < argc) { req.stdin_data = slurp(argv[++i]); continue; }
            if (a == "--timeout" && i + 1 < argc) {
                if (!parse_int_arg(argv[++i], &req.timeout_ms)) {
                    std::cerr << "bad --timeout value\n";
                    return 2;
                }
                continue;
            }
            std::cerr << "unknown argument: " << a << "\n";
            return 2;
        }
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    EngineConfig cfg = load_engine_config(argv[0]);
    cfg.workers = 1;
    Dispatcher d(cfg);
    ExecutionResult res;
    DispatchStatus st = d.submit(req, &res);
    if (st != DispatchStatus::OK) {
        std::cerr << "rejected: " << dispatchstatus_to_str(st) << "\n";
        return 2;
    }
    std::cout << encode_result(res) << "\n";
    return res.status == Outcome::SUCCESS ? 0 : 1;
}

int cmd_grade(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: cordon_cli grade <cases.json> <program>\n";
        return 2;
    }

    std::vector<TestCase> cases;
    std::string code;
    try {
        std::string err;
        if (!decode_test_cases(slurp(argv[2]), &cases, &err)) {
            std::cerr << argv[2] << ": " << err << "\n";
            return 2;
        }
        code = slurp(argv[3]);
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    EngineConfig cfg = load_engine_config(argv[0]);
    cfg.workers = 1;
    Dispatcher d(cfg);
    GradeReport rep;
    DispatchStatus st = run_test_cases(d, code, cases, &rep);
    if (st != DispatchStatus::OK) {
        std::cerr << "rejected: " << dispatchstatus_to_str(st) << "\n";
        return 2;
    }
    std::cout << encode_grade_report(rep) << "\n";
    return rep.passed == rep.total ? 0 : 1;
}
