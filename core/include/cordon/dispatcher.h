#pragma once

#include "cordon/bqueue.h"
#include "cordon/config.h"
#include "cordon/log.h"
#include "cordon/types.h"

#include <array>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace cordon {

enum class DispatchStatus { OK, BUSY, INVALID, SHUTDOWN };

const char* dispatchstatus_to_str(DispatchStatus s);

constexpr size_t kOutcomeCount = 7;

struct DispatchStats {
    uint64_t submitted{0};
    uint64_t rejected_busy{0};
    uint64_t rejected_invalid{0};
    uint64_t completed{0};
    int64_t in_flight{0};
    int64_t queued{0};
    int workers{0};
    std::array<uint64_t, kOutcomeCount> by_outcome{};
};

// Runs one validated request. The default executes it in a cordon_cell
// process; tests inject their own.
using ExecuteFn = std::function<ExecutionResult(const ExecutionRequest&, const CancelToken*)>;

// Execution Dispatcher
// - Fixed worker pool fed by a bounded FIFO queue
// - Admission never blocks: BUSY when no worker is idle and the queue is full
// - Each accepted request completes exactly once, including during shutdown
class Dispatcher {
public:
    explicit Dispatcher(const EngineConfig& cfg, ExecuteFn exec = nullptr);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Blocks until the request completes. `out` is filled only on OK.
    DispatchStatus submit(const ExecutionRequest& req, ExecutionResult* out,
                          std::shared_ptr<CancelToken> cancel = nullptr);

    // `out` receives a future for the result only on OK.
    DispatchStatus submit_async(const ExecutionRequest& req, std::future<ExecutionResult>* out,
                                std::shared_ptr<CancelToken> cancel = nullptr);

    DispatchStats stats() const;

    // Stop admitting, let queued and running requests finish, join workers.
    // Idempotent.
    void shutdown();

    const EngineConfig& config() const { return cfg_; }

private:
    struct Job {
        ExecutionRequest req;
        std::shared_ptr<CancelToken> cancel;
        std::promise<ExecutionResult> done;
    };

    void worker_loop(int idx);
    ExecutionResult execute(const Job& job);
    void record(const ExecutionRequest& req, const ExecutionResult& r);

    EngineConfig cfg_;
    ExecuteFn exec_;
    std::unique_ptr<EventLog> events_;
    BoundedQueue<std::unique_ptr<Job>> queue_;
    std::vector<std::thread> workers_;

    mutable std::mutex mu_;
    DispatchStats stats_;
    bool stopped_{false};
    std::mutex stop_mu_;
};

} // namespace cordon
