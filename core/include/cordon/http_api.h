#pragma once

#include "cordon/dispatcher.h"

#include <string>

namespace cordon {

struct HttpResponse {
    int code{200};
    std::string content_type{"application/json"};
    std::string body;
};

// Body cap for POST requests.
constexpr size_t kMaxHttpBodyBytes = 1024 * 1024;

// Route one parsed HTTP request. No authentication.
//   POST /api/code/execute  request JSON -> result JSON (400 invalid, 503 busy)
//   POST /api/code/grade    {"code", "test_cases"} -> grade report
//   GET  /health, /stats, /metrics
HttpResponse route_request(Dispatcher& d, const std::string& method, const std::string& path,
                           const std::string& body);

std::string encode_stats(const DispatchStats& s);
// Prometheus text exposition.
std::string metrics_text(const DispatchStats& s);

} // namespace cordon
