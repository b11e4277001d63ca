#pragma once

#include "cordon/script/outcome.h"
#include "cordon/types.h"

#include <string>
#include <vector>

struct json_object;

namespace cordon {

// ExecutionRequest: {"code", "stdin"?, "timeout_ms"?, "echo_prompt"?, "request_id"?}
std::string encode_request(const ExecutionRequest& req);
bool decode_request(const std::string& json, ExecutionRequest* out, std::string* err);
bool decode_request_object(json_object* o, ExecutionRequest* out, std::string* err);

// ExecutionResult. `message` is only emitted for non-Success results.
json_object* result_to_json(const ExecutionResult& r);
std::string encode_result(const ExecutionResult& r);
bool decode_result(const std::string& json, ExecutionResult* out, std::string* err);

// Cell protocol: request on the cell's stdin, one status line on fd 3.
std::string encode_cell_request(const CellRequest& req);
bool decode_cell_request(const std::string& json, CellRequest* out, std::string* err);
std::string encode_cell_status(const script::ScriptOutcome& st);
bool decode_cell_status(const std::string& json, script::ScriptOutcome* out, std::string* err);

// Grading: a JSON array of {"input", "expected"}.
bool decode_test_cases(json_object* arr, std::vector<TestCase>* out, std::string* err);
bool decode_test_cases(const std::string& json, std::vector<TestCase>* out, std::string* err);
std::string encode_grade_report(const GradeReport& rep);

} // namespace cordon
