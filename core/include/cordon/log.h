#pragma once
#include "cordon/types.h"

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace cordon {

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

const char* loglevel_to_str(LogLevel l);
// Case-insensitive; false on unknown names.
bool loglevel_from_str(const std::string& s, LogLevel* out);

void set_log_level(LogLevel l);
LogLevel log_level();

// Operator log: one `[tag] LEVEL message` line on stderr.
void log_line(LogLevel l, const std::string& tag, const std::string& msg);

// JSONL execution log, one sorted-key record per request. Never records
// submitted code or program output.
class EventLog {
public:
    explicit EventLog(const std::string& path);
    bool ok() const { return out_.is_open(); }
    const std::string& path() const { return path_; }

    void execution(const std::string& request_id, const ExecutionResult& r);

private:
    std::mutex mu_;
    std::string path_;
    std::ofstream out_;
    uint64_t seq_{0};
};

} // namespace cordon
