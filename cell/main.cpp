// cordon_cell: the per-request execution context.
//
// Reads one JSON cell request from stdin, starts the embedded interpreter,
// compiles the program, locks itself down, runs it and reports exactly one
// status line on kCellStatusFd. Program output goes to fd 1 and fd 2
// unbuffered by stdio.

#include "cordon/capability.h"
#include "cordon/codec.h"
#include "cordon/proc.h"
#include "cordon/sandbox.h"
#include "cordon/script/interpreter.h"

#include <cerrno>
#include <cstring>
#include <new>
#include <string>

#include <fcntl.h>
#include <sys/prctl.h>
#include <unistd.h>

using namespace cordon;

namespace {

constexpr size_t kMaxRequestBytes = 4 * 1024 * 1024;
constexpr size_t kSinkFlushBytes = 8 * 1024;

bool write_all(int fd, const char* p, size_t n) {
    while (n > 0) {
        ssize_t w = ::write(fd, p, n);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += w;
        n -= (size_t)w;
    }
    return true;
}

// Buffered sink over a raw descriptor. Write errors are dropped: once the
// host stops reading, the host is already tearing the cell down.
class FdSink : public script::OutputSink {
public:
    explicit FdSink(int fd) : fd_(fd) {}
    ~FdSink() override { flush(); }

    void write(const std::string& data) override {
        buf_ += data;
        if (buf_.size() >= kSinkFlushBytes) flush();
    }

    void flush() override {
        if (buf_.empty()) return;
        (void)write_all(fd_, buf_.data(), buf_.size());
        buf_.clear();
    }

private:
    int fd_;
    std::string buf_;
};

bool slurp_stdin(std::string* out) {
    char buf[8192];
    for (;;) {
        ssize_t n = ::read(0, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return true;
        out->append(buf, (size_t)n);
        if (out->size() > kMaxRequestBytes) return false;
    }
}

// Fallback when the heap is too exhausted to encode a status document.
const char kMemoryStatus[] = "{\"error_type\":\"MemoryError\",\"kind\":\"memory\",\"line\":0,\"message\":\"\"}\n";

[[noreturn]] void finish(const script::ScriptOutcome& oc) {
    try {
        std::string line = encode_cell_status(oc) + "\n";
        (void)write_all(kCellStatusFd, line.data(), line.size());
    } catch (const std::bad_alloc&) {
        (void)write_all(kCellStatusFd, kMemoryStatus, sizeof(kMemoryStatus) - 1);
    }
    _exit(0);
}

[[noreturn]] void finish_internal(const std::string& msg) {
    script::ScriptOutcome oc;
    oc.kind = script::RunKind::INTERNAL;
    oc.error_type = "InternalError";
    oc.message = msg;
    finish(oc);
}

} // namespace

int main(int argc, char** argv) {
    (void)argv;
    if (argc != 1) {
        static const char usage[] = "usage: cordon_cell  (JSON request on stdin, status on fd 3)\n";
        (void)write_all(2, usage, sizeof(usage) - 1);
        return 2;
    }
    // Refuse to run without the status channel the host provides.
    if (::fcntl(kCellStatusFd, F_GETFD) < 0) {
        static const char msg[] = "cordon_cell: status descriptor not open\n";
        (void)write_all(2, msg, sizeof(msg) - 1);
        return 2;
    }

    std::string raw;
    if (!slurp_stdin(&raw)) finish_internal("cannot read cell request");

    CellRequest req;
    std::string err;
    if (!decode_cell_request(raw, &req, &err)) finish_internal(err);
    raw.clear();
    raw.shrink_to_fit();

    // The interpreter loads its modules from disk and reads a syntax error's
    // source line back by file name; after the filter it can do neither.
    const CapabilityPolicy policy = CapabilityPolicy::pure_default();
    if (!script::runtime_initialize(policy, &err)) finish_internal(err);

    FdSink out(1);
    FdSink errs(2);
    script::CompiledProgram prog;
    script::ScriptOutcome oc = script::compile_script(req.code, policy, errs, &prog);
    if (oc.kind != script::RunKind::OK) {
        errs.flush();
        finish(oc);
    }

    if (req.seccomp) {
        (void)::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        std::string serr = install_seccomp_filter();
        // Best effort unless required; stderr belongs to the program.
        if (!serr.empty() && req.seccomp_required) finish_internal("seccomp: " + serr);
    }

    script::InterpreterOptions opts;
    opts.stdin_data = std::move(req.stdin_data);
    opts.echo_prompt = req.echo_prompt;
    opts.max_call_depth = req.max_call_depth;
    oc = script::run_compiled(prog, policy, out, errs, opts);
    out.flush();
    errs.flush();
    finish(oc);
}
