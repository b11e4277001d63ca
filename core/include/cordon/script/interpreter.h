#pragma once

// Embedded CPython runtime for sandboxed programs.
//
// One interpreter per process. Each run gets a fresh global namespace whose
// `__builtins__` is built from the capability table, an import gate that
// hands out private copies of permitted modules, and sys.stdout/sys.stderr
// bound to the caller's sinks.

#include "cordon/capability.h"
#include "cordon/script/outcome.h"

#include <string>

// PyObject, kept opaque so only the runtime sees Python.h.
struct _object;

namespace cordon::script {

class OutputSink {
public:
    virtual ~OutputSink() = default;
    virtual void write(const std::string& data) = 0;
    virtual void flush() {}
};

class StringSink : public OutputSink {
public:
    void write(const std::string& data) override { buf_ += data; }
    const std::string& str() const { return buf_; }

private:
    std::string buf_;
};

struct InterpreterOptions {
    std::string stdin_data;
    bool echo_prompt{true};
    int max_call_depth{200};
};

// Start the interpreter in isolated mode (no site, no environment, no signal
// handlers) and import every module `policy` permits, so later runs never
// touch the filesystem. Call before the syscall filter goes in. Idempotent.
bool runtime_initialize(const CapabilityPolicy& policy, std::string* err);

// A program that compiled and passed the pre-scan.
class CompiledProgram {
public:
    CompiledProgram() = default;
    ~CompiledProgram();

    CompiledProgram(const CompiledProgram&) = delete;
    CompiledProgram& operator=(const CompiledProgram&) = delete;

    bool ready() const { return code_ != nullptr; }
    void reset(_object* code);

private:
    friend ScriptOutcome compile_script(const std::string&, const CapabilityPolicy&, OutputSink&,
                                        CompiledProgram*);
    friend ScriptOutcome run_compiled(const CompiledProgram&, const CapabilityPolicy&, OutputSink&,
                                      OutputSink&, const InterpreterOptions&);

    _object* code_{nullptr};
};

// Compile and pre-scan `source`. A syntax error (its fault line also goes to
// `err`) or a denial comes back as the outcome; on OK `prog` is ready.
// CPython reads the source line of a syntax error back by file name, so this
// runs before the syscall filter.
ScriptOutcome compile_script(const std::string& source, const CapabilityPolicy& policy, OutputSink& err,
                             CompiledProgram* prog);

// Run a compiled program in a fresh namespace. Filesystem-free.
ScriptOutcome run_compiled(const CompiledProgram& prog, const CapabilityPolicy& policy, OutputSink& out,
                           OutputSink& err, const InterpreterOptions& opts);

// compile_script then run_compiled. Initializes the
// runtime on first use. Never throws for program faults; uncaught faults
// also write one `Type: message (line N)` line to `err`. Runs are serialized.
ScriptOutcome run_script(const std::string& source, const CapabilityPolicy& policy,
                         OutputSink& out, OutputSink& err, const InterpreterOptions& opts);

} // namespace cordon::script
