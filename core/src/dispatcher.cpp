#include "cordon/dispatcher.h"
#include "cordon/classifier.h"
#include "cordon/runner.h"

#include <exception>

namespace cordon {

const char* dispatchstatus_to_str(DispatchStatus s) {
    switch (s) {
        case DispatchStatus::OK: return "OK";
        case DispatchStatus::BUSY: return "BUSY";
        case DispatchStatus::INVALID: return "INVALID";
        case DispatchStatus::SHUTDOWN: return "SHUTDOWN";
    }
    return "UNKNOWN";
}

Dispatcher::Dispatcher(const EngineConfig& cfg, ExecuteFn exec)
    : cfg_(cfg), exec_(std::move(exec)), queue_(cfg.queue_capacity) {
    if (!exec_) {
        auto runner = std::make_shared<IsolatedRunner>(cfg_);
        exec_ = [runner](const ExecutionRequest& req, const CancelToken* cancel) {
            return runner->run(req, cancel);
        };
    }
    if (!cfg_.event_log_path.empty()) {
        events_ = std::make_unique<EventLog>(cfg_.event_log_path);
        if (!events_->ok()) {
            log_line(LogLevel::WARN, "dispatch", "cannot open event log " + cfg_.event_log_path);
            events_.reset();
        }
    }

    int n = cfg_.workers < 1 ? 1 : cfg_.workers;
    stats_.workers = n;
    workers_.reserve((size_t)n);
    for (int i = 0; i < n; i++) {
        workers_.emplace_back([this, i]{ worker_loop(i); });
    }
    log_line(LogLevel::INFO, "dispatch",
             "started workers=" + std::to_string(n) + " queue_capacity=" + std::to_string(cfg_.queue_capacity));
}

Dispatcher::~Dispatcher() {
    shutdown();
}

DispatchStatus Dispatcher::submit_async(const ExecutionRequest& req, std::future<ExecutionResult>* out,
                                        std::shared_ptr<CancelToken> cancel) {
    if (req.code.empty()) {
        std::lock_guard<std::mutex> lk(mu_);
        stats_.rejected_invalid++;
        return DispatchStatus::INVALID;
    }

    auto job = std::make_unique<Job>();
    job->req = req;
    job->req.timeout_ms = cfg_.effective_timeout_ms(req.timeout_ms);
    job->cancel = std::move(cancel);
    std::future<ExecutionResult> fut = job->done.get_future();

    // Count before the hand-off so a fast worker never sees negative gauges.
    {
        std::lock_guard<std::mutex> lk(mu_);
        stats_.queued++;
    }
    switch (queue_.try_push(std::move(job))) {
        case BoundedQueue<std::unique_ptr<Job>>::Push::OK:
            break;
        case BoundedQueue<std::unique_ptr<Job>>::Push::FULL: {
            std::lock_guard<std::mutex> lk(mu_);
            stats_.queued--;
            stats_.rejected_busy++;
            return DispatchStatus::BUSY;
        }
        case BoundedQueue<std::unique_ptr<Job>>::Push::CLOSED: {
            std::lock_guard<std::mutex> lk(mu_);
            stats_.queued--;
            return DispatchStatus::SHUTDOWN;
        }
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        stats_.submitted++;
    }
    if (out) *out = std::move(fut);
    return DispatchStatus::OK;
}

DispatchStatus Dispatcher::submit(const ExecutionRequest& req, ExecutionResult* out,
                                  std::shared_ptr<CancelToken> cancel) {
    std::future<ExecutionResult> fut;
    DispatchStatus st = submit_async(req, &fut, std::move(cancel));
    if (st != DispatchStatus::OK) return st;
    ExecutionResult r = fut.get();
    if (out) *out = std::move(r);
    return DispatchStatus::OK;
}

DispatchStats Dispatcher::stats() const {
    std::lock_guard<std::mutex> lk(mu_);
    return stats_;
}

void Dispatcher::shutdown() {
    std::lock_guard<std::mutex> lk(stop_mu_);
    if (stopped_) return;
    stopped_ = true;
    queue_.shutdown();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    log_line(LogLevel::INFO, "dispatch", "stopped");
}

ExecutionResult Dispatcher::execute(const Job& job) {
    if (job.cancel && job.cancel->is_cancelled()) {
        ExecutionResult r = make_result(Outcome::TIMEOUT, "execution cancelled");
        r.limit = LimitHit::CANCELLED;
        return r;
    }
    try {
        return exec_(job.req, job.cancel.get());
    } catch (const std::bad_alloc&) {
        log_line(LogLevel::ERROR, "dispatch", "request=" + job.req.request_id + " out of memory in host");
    } catch (const std::exception& e) {
        log_line(LogLevel::ERROR, "dispatch", "request=" + job.req.request_id + " " + e.what());
    } catch (...) {
        log_line(LogLevel::ERROR, "dispatch", "request=" + job.req.request_id + " unknown exception");
    }
    return make_result(Outcome::INTERNAL_ERROR, "internal error");
}

void Dispatcher::record(const ExecutionRequest& req, const ExecutionResult& r) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stats_.in_flight--;
        stats_.completed++;
        size_t k = (size_t)r.status;
        if (k < kOutcomeCount) stats_.by_outcome[k]++;
    }
    if (events_) events_->execution(req.request_id, r);
}

void Dispatcher::worker_loop(int idx) {
    std::unique_ptr<Job> job;
    while (queue_.pop(job)) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            stats_.queued--;
            stats_.in_flight++;
        }
        ExecutionResult r = execute(*job);
        record(job->req, r);
        log_line(LogLevel::DEBUG, "dispatch",
                 "worker=" + std::to_string(idx) + " request=" + job->req.request_id +
                 " status=" + outcome_to_str(r.status));
        job->done.set_value(std::move(r));
        job.reset();
    }
}

} // namespace cordon
