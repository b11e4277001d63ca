#include "cordon/log.h"
#include "cordon/json_mini.h"

#include <json-c/json.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cordon {

namespace {

std::atomic<int> g_level{(int)LogLevel::INFO};
std::mutex g_log_mu;

std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace

const char* loglevel_to_str(LogLevel l) {
    switch (l) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

bool loglevel_from_str(const std::string& s, LogLevel* out) {
    std::string v = s;
    for (auto& c : v) c = (char)std::toupper((unsigned char)c);
    if (v == "DEBUG") *out = LogLevel::DEBUG;
    else if (v == "INFO") *out = LogLevel::INFO;
    else if (v == "WARN" || v == "WARNING") *out = LogLevel::WARN;
    else if (v == "ERROR") *out = LogLevel::ERROR;
    else return false;
    return true;
}

void set_log_level(LogLevel l) { g_level.store((int)l); }
LogLevel log_level() { return (LogLevel)g_level.load(); }

void log_line(LogLevel l, const std::string& tag, const std::string& msg) {
    if ((int)l < g_level.load()) return;
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::cerr << "[" << tag << "] " << loglevel_to_str(l) << " " << msg << "\n";
    std::cerr.flush();
}

EventLog::EventLog(const std::string& path)
    : path_(path), out_(path, std::ios::out | std::ios::app) {}

void EventLog::execution(const std::string& request_id, const ExecutionResult& r) {
    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string("execution"));
    json_object_object_add(rec, "ts", json_object_new_string(iso_now().c_str()));
    json_object_object_add(rec, "request_id", json_mini::new_string(request_id));
    json_object_object_add(rec, "status", json_object_new_string(outcome_to_str(r.status)));
    json_object_object_add(rec, "duration_ms", json_object_new_int64(r.duration_ms));
    json_object_object_add(rec, "limit", json_object_new_string(limithit_to_str(r.limit)));
    json_object_object_add(rec, "cpu_ms", json_object_new_int64(r.cpu_ms));
    json_object_object_add(rec, "max_rss_kb", json_object_new_int64(r.max_rss_kb));

    std::lock_guard<std::mutex> lk(mu_);
    json_object_object_add(rec, "seq", json_object_new_int64((int64_t)++seq_));
    out_ << json_mini::to_string(rec) << "\n";
    out_.flush();
    json_object_put(rec);
}

} // namespace cordon
