#include "pyref.h"

#include "cordon/script/interpreter.h"
#include "cordon/script/prescan.h"

#include <algorithm>
#include <mutex>
#include <new>
#include <string>
#include <vector>

namespace cordon::script {

namespace {

constexpr const char* kProgramFile = "<program>";
// Interpreter frames between the module body and the program's first call.
constexpr int kRecursionSlack = 5;

// The run in progress. Runs are serialized by g_run_mutex and only touched
// with the GIL held.
struct RunState {
    OutputSink* out{nullptr};
    const CapabilityPolicy* policy{nullptr};
    const std::string* stdin_data{nullptr};
    size_t stdin_pos{0};
    bool echo_prompt{true};
    std::string violation;      // first denied capability name, empty if none
    int violation_line{0};
    PyObject* modules{nullptr}; // this run's module copies, owned by run_script
};

std::mutex g_init_mutex;
std::mutex g_run_mutex;
bool g_ready = false;
std::string g_init_error;   // set once initialization has failed
RunState* g_run = nullptr;

PyObject* g_builtins = nullptr;     // the real builtins module dict
PyObject* g_denied_type = nullptr;  // CapabilityDenied, a BaseException
PyTypeObject* g_sink_type = nullptr;
PyObject* g_input_fn = nullptr;
PyObject* g_import_fn = nullptr;

int current_line() {
    PyFrameObject* f = PyEval_GetFrame();
    return f ? PyFrame_GetLineNumber(f) : 0;
}

// Once a capability is denied at run time the program is over: every later
// trace event raises again, so no handler or finally block runs to completion.
int violation_trace(PyObject*, PyFrameObject*, int, PyObject*) {
    if (!g_run || g_run->violation.empty()) return 0;
    PyErr_Format(g_denied_type, "capability '%s' not permitted", g_run->violation.c_str());
    return -1;
}

PyObject* raise_violation(const std::string& name) {
    if (g_run && g_run->violation.empty()) {
        g_run->violation = name;
        g_run->violation_line = current_line();
        PyEval_SetTrace(violation_trace, nullptr);
    }
    PyErr_Format(g_denied_type, "capability '%s' not permitted", name.c_str());
    return nullptr;
}

// ---- sys.stdout / sys.stderr ----

struct SinkObject {
    PyObject_HEAD
    OutputSink* sink;
};

PyObject* sink_write(PyObject* self, PyObject* arg) {
    auto* so = reinterpret_cast<SinkObject*>(self);
    if (!PyUnicode_Check(arg)) {
        PyErr_Format(PyExc_TypeError, "write() argument must be str, not %.100s", Py_TYPE(arg)->tp_name);
        return nullptr;
    }
    Py_ssize_t n = 0;
    const char* data = PyUnicode_AsUTF8AndSize(arg, &n);
    if (!data) return nullptr;
    if (!so->sink) {
        PyErr_SetString(PyExc_ValueError, "I/O operation on closed file");
        return nullptr;
    }
    try {
        so->sink->write(std::string(data, (size_t)n));
    } catch (const std::bad_alloc&) {
        return PyErr_NoMemory();
    }
    return PyLong_FromSsize_t(PyUnicode_GET_LENGTH(arg));
}

PyObject* sink_flush(PyObject* self, PyObject*) {
    auto* so = reinterpret_cast<SinkObject*>(self);
    if (so->sink) so->sink->flush();
    Py_RETURN_NONE;
}

void sink_dealloc(PyObject* self) {
    PyTypeObject* tp = Py_TYPE(self);
    PyObject_Free(self);
    Py_DECREF(tp);
}

PyMethodDef kSinkMethods[] = {
    {"write", sink_write, METH_O, nullptr},
    {"flush", sink_flush, METH_NOARGS, nullptr},
    {nullptr, nullptr, 0, nullptr},
};

PyType_Slot kSinkSlots[] = {
    {Py_tp_methods, kSinkMethods},
    {Py_tp_dealloc, reinterpret_cast<void*>(sink_dealloc)},
    {0, nullptr},
};

PyType_Spec kSinkSpec = {"cordon.Sink", (int)sizeof(SinkObject), 0,
                         Py_TPFLAGS_DEFAULT | Py_TPFLAGS_DISALLOW_INSTANTIATION, kSinkSlots};

PyRef make_sink(OutputSink* sink) {
    SinkObject* so = PyObject_New(SinkObject, g_sink_type);
    if (!so) return PyRef();
    so->sink = sink;
    return PyRef(reinterpret_cast<PyObject*>(so));
}

void close_sink(PyObject* o) {
    if (o) reinterpret_cast<SinkObject*>(o)->sink = nullptr;
}

// ---- builtins that differ from CPython's ----

PyObject* builtin_input(PyObject*, PyObject* args) {
    PyObject* prompt = nullptr;
    if (!PyArg_UnpackTuple(args, "input", 0, 1, &prompt)) return nullptr;
    RunState* st = g_run;
    if (!st) {
        PyErr_SetString(PyExc_RuntimeError, "input(): no program is running");
        return nullptr;
    }
    if (prompt && st->echo_prompt) {
        PyRef text(PyObject_Str(prompt));
        if (!text) return nullptr;
        try {
            st->out->write(py_utf8(text.get()));
        } catch (const std::bad_alloc&) {
            return PyErr_NoMemory();
        }
    }
    const std::string& in = *st->stdin_data;
    if (st->stdin_pos >= in.size()) {
        PyErr_SetString(PyExc_EOFError, "EOF when reading a line");
        return nullptr;
    }
    size_t start = st->stdin_pos;
    size_t nl = in.find('\n', start);
    size_t end = nl == std::string::npos ? in.size() : nl;
    st->stdin_pos = nl == std::string::npos ? in.size() : nl + 1;
    if (end > start && in[end - 1] == '\r') --end;
    return PyUnicode_DecodeUTF8(in.data() + start, (Py_ssize_t)(end - start), "replace");
}

// Private copy of a permitted module, so one run cannot leave state behind
// for the next one sharing this process.
PyObject* module_copy(RunState* st, const std::string& name) {
    PyObject* cached = PyDict_GetItemString(st->modules, name.c_str());
    if (cached) {
        Py_INCREF(cached);
        return cached;
    }
    // not PyImport_ImportModule: that resolves __import__ through the
    // program's own builtins, which is this gate
    PyRef orig(PyImport_ImportModuleLevel(name.c_str(), nullptr, nullptr, nullptr, 0));
    if (!orig) return nullptr;
    PyRef copy(PyModule_New(name.c_str()));
    if (!copy) return nullptr;
    PyObject* src = PyModule_GetDict(orig.get());
    PyObject* dst = PyModule_GetDict(copy.get());
    PyObject *key = nullptr, *value = nullptr;
    Py_ssize_t pos = 0;
    while (PyDict_Next(src, &pos, &key, &value)) {
        if (is_dunder(py_utf8(key))) continue;
        if (PyDict_SetItem(dst, key, value) < 0) return nullptr;
    }
    if (PyDict_SetItemString(st->modules, name.c_str(), copy.get()) < 0) return nullptr;
    return copy.release();
}

PyObject* builtin_import(PyObject*, PyObject* args, PyObject* kwargs) {
    static const char* kwlist[] = {"name", "globals", "locals", "fromlist", "level", nullptr};
    PyObject* name = nullptr;
    PyObject *globals = nullptr, *locals = nullptr, *fromlist = nullptr;
    int level = 0;
    if (!PyArg_ParseTupleAndKeywords(args, kwargs, "U|OOOi:__import__", const_cast<char**>(kwlist), &name,
                                     &globals, &locals, &fromlist, &level)) {
        return nullptr;
    }
    std::string module = py_utf8(name);
    RunState* st = g_run;
    if (level > 0) return raise_violation(std::string((size_t)level, '.') + module);
    if (!st || !st->policy->permits_module(module)) {
        CapabilityPolicy none;
        return raise_violation(CapabilityPolicy::denied_module_name(module, st ? *st->policy : none));
    }
    return module_copy(st, module);
}

// Stand-in for a builtin whose capability is not permitted; `self` is its name.
PyObject* builtin_denied(PyObject* self, PyObject*, PyObject*) {
    return raise_violation(py_utf8(self));
}

PyMethodDef kInputDef = {"input", builtin_input, METH_VARARGS, nullptr};
PyMethodDef kImportDef = {"__import__", reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)(void)>(builtin_import)),
                          METH_VARARGS | METH_KEYWORDS, nullptr};
PyMethodDef kDeniedDef = {"denied", reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)(void)>(builtin_denied)),
                          METH_VARARGS | METH_KEYWORDS, nullptr};

// `__builtins__` for one run: table entries the policy permits, stand-ins
// for the ones it does not, nothing else.
PyRef restricted_builtins(const CapabilityPolicy& policy) {
    PyRef dict(PyDict_New());
    if (!dict) return dict;
    PyObject *key = nullptr, *value = nullptr;
    Py_ssize_t pos = 0;
    while (PyDict_Next(g_builtins, &pos, &key, &value)) {
        Capability cap;
        if (!builtin_capability(py_utf8(key), &cap)) continue;
        if (policy.is_permitted(cap)) {
            if (PyDict_SetItem(dict.get(), key, value) < 0) return PyRef();
            continue;
        }
        PyRef guard(PyCFunction_NewEx(&kDeniedDef, key, nullptr));
        if (!guard || PyDict_SetItem(dict.get(), key, guard.get()) < 0) return PyRef();
    }
    if (policy.permits_builtin("input") && PyDict_SetItemString(dict.get(), "input", g_input_fn) < 0) return PyRef();
    if (PyDict_SetItemString(dict.get(), "__import__", g_import_fn) < 0) return PyRef();
    return dict;
}

struct PyError {
    PyRef type, value, tb;

    static PyError fetch() {
        PyObject *t = nullptr, *v = nullptr, *b = nullptr;
        PyErr_Fetch(&t, &v, &b);
        PyErr_NormalizeException(&t, &v, &b);
        PyError e;
        e.type = PyRef(t);
        e.value = PyRef(v);
        e.tb = PyRef(b);
        return e;
    }

    bool is(PyObject* exc) const { return type && PyErr_GivenExceptionMatches(type.get(), exc); }

    std::string type_name() const {
        if (!type || !PyType_Check(type.get())) return "Exception";
        return reinterpret_cast<PyTypeObject*>(type.get())->tp_name;
    }

    // Innermost traceback line that belongs to the program itself.
    int program_line() const {
        int line = 0;
        PyRef tb = PyRef::borrow(this->tb.get());
        while (tb && tb.get() != Py_None) {
            PyRef frame(PyObject_GetAttrString(tb.get(), "tb_frame"));
            PyRef code(frame ? PyObject_GetAttrString(frame.get(), "f_code") : nullptr);
            PyRef file(code ? PyObject_GetAttrString(code.get(), "co_filename") : nullptr);
            PyErr_Clear();
            if (py_utf8(file.get()) == kProgramFile) line = (int)py_attr_long(tb.get(), "tb_lineno", line);
            tb = PyRef(PyObject_GetAttrString(tb.get(), "tb_next"));
            if (!tb) PyErr_Clear();
        }
        return line;
    }
};

ScriptOutcome memory_outcome() {
    ScriptOutcome oc;
    oc.kind = RunKind::MEMORY;
    oc.error_type = "MemoryError";
    return oc;
}

ScriptOutcome internal_outcome(const std::string& msg) {
    ScriptOutcome oc;
    oc.kind = RunKind::INTERNAL;
    oc.error_type = "InternalError";
    oc.message = msg;
    return oc;
}

// A compile failure. The parser reports a program nested too deeply for its
// stack as MemoryError or RecursionError with a message; those are syntax
// errors too. A bare MemoryError is the memory ceiling.
ScriptOutcome compile_outcome() {
    PyError e = PyError::fetch();
    std::string msg = py_str(e.value.get());
    if (e.is(PyExc_MemoryError) && msg.empty()) return memory_outcome();
    ScriptOutcome oc;
    oc.kind = RunKind::SYNTAX_ERROR;
    if (e.is(PyExc_SyntaxError)) {
        oc.error_type = e.type_name();
        PyRef m(PyObject_GetAttrString(e.value.get(), "msg"));
        if (!m) PyErr_Clear();
        oc.message = m ? py_str(m.get()) : msg;
        oc.line = (int)py_attr_long(e.value.get(), "lineno", 0);
    } else {
        oc.error_type = "SyntaxError";
        oc.message = msg;
    }
    return oc;
}

// Outcome of a program that ended with an exception pending.
ScriptOutcome fault_outcome(const RunState& st) {
    PyError e = PyError::fetch();
    ScriptOutcome oc;
    if (!st.violation.empty()) {
        oc.kind = RunKind::SECURITY_VIOLATION;
        oc.error_type = "CapabilityDenied";
        oc.message = "capability '" + st.violation + "' not permitted";
        oc.line = st.violation_line;
        return oc;
    }
    if (e.is(PyExc_MemoryError)) return memory_outcome();
    if (e.is(PyExc_SystemExit)) {
        PyRef code(PyObject_GetAttrString(e.value.get(), "code"));
        if (!code) PyErr_Clear();
        if (!code || code.get() == Py_None || (PyLong_Check(code.get()) && PyLong_AsLong(code.get()) == 0)) {
            PyErr_Clear();
            return oc;
        }
    }
    oc.kind = RunKind::RUNTIME_FAULT;
    oc.error_type = e.type_name();
    oc.message = py_str(e.value.get());
    oc.line = e.program_line();
    return oc;
}

// Installs the run's sinks, recursion limit and state; undoes all of it on
// scope exit, including on the paths that return early.
class RunScope {
public:
    RunScope(RunState* st, OutputSink& out, OutputSink& err, int max_call_depth)
        : saved_limit_(Py_GetRecursionLimit()) {
        saved_out_ = PyRef::borrow(PySys_GetObject("stdout"));
        saved_err_ = PyRef::borrow(PySys_GetObject("stderr"));
        modules_ = PyRef(PyDict_New());
        out_ = make_sink(&out);
        err_ = make_sink(&err);
        ok_ = modules_ && out_ && err_ && PySys_SetObject("stdout", out_.get()) == 0 &&
              PySys_SetObject("stderr", err_.get()) == 0;
        st->modules = modules_.get();
        Py_SetRecursionLimit(max_call_depth + kRecursionSlack);
        g_run = st;
    }

    ~RunScope() {
        PyEval_SetTrace(nullptr, nullptr);
        g_run = nullptr;
        close_sink(out_.get());
        close_sink(err_.get());
        PyObject *t = nullptr, *v = nullptr, *b = nullptr;
        PyErr_Fetch(&t, &v, &b);
        (void)PySys_SetObject("stdout", saved_out_ ? saved_out_.get() : Py_None);
        (void)PySys_SetObject("stderr", saved_err_ ? saved_err_.get() : Py_None);
        PyErr_Restore(t, v, b);
        if (modules_) PyDict_Clear(modules_.get());
        Py_SetRecursionLimit(saved_limit_);
    }

    RunScope(const RunScope&) = delete;
    RunScope& operator=(const RunScope&) = delete;

    bool ok() const { return ok_; }

private:
    int saved_limit_;
    PyRef saved_out_, saved_err_;
    PyRef modules_, out_, err_;
    bool ok_{false};
};

bool setup_runtime(const CapabilityPolicy& policy, std::string* err) {
    PyRef builtins(PyImport_ImportModule("builtins"));
    if (!builtins) {
        *err = "python runtime: cannot load builtins";
        return false;
    }
    g_builtins = PyModule_GetDict(builtins.get());
    Py_INCREF(g_builtins);

    // The scanner and the name lookups CPython does lazily (\N{...} escapes).
    std::vector<std::string> preload = {"ast", "unicodedata"};
    for (const auto& m : module_names()) {
        if (policy.permits_module(m)) preload.push_back(m);
    }
    for (const auto& m : preload) {
        PyRef mod(PyImport_ImportModule(m.c_str()));
        // a permitted module that is not installed fails at import time instead
        if (!mod) PyErr_Clear();
    }

    g_denied_type = PyErr_NewException("cordon.CapabilityDenied", PyExc_BaseException, nullptr);
    g_sink_type = reinterpret_cast<PyTypeObject*>(PyType_FromSpec(&kSinkSpec));
    g_input_fn = PyCFunction_NewEx(&kInputDef, nullptr, nullptr);
    g_import_fn = PyCFunction_NewEx(&kImportDef, nullptr, nullptr);
    if (!g_denied_type || !g_sink_type || !g_input_fn || !g_import_fn) {
        PyErr_Clear();
        *err = "python runtime: cannot create runtime objects";
        return false;
    }
    return true;
}

ScriptOutcome compile_locked(const std::string& source, const CapabilityPolicy& policy, OutputSink& err,
                             CompiledProgram* prog) {
    size_t nul = source.find('\0');
    if (nul != std::string::npos) {
        ScriptOutcome oc;
        oc.kind = RunKind::SYNTAX_ERROR;
        oc.error_type = "SyntaxError";
        oc.message = "source code cannot contain null bytes";
        oc.line = 1 + (int)std::count(source.begin(), source.begin() + (long)nul, '\n');
        err.write(fault_line(oc) + "\n");
        return oc;
    }

    PyRef code(Py_CompileString(source.c_str(), kProgramFile, Py_file_input));
    if (!code) {
        ScriptOutcome oc = compile_outcome();
        if (oc.kind == RunKind::SYNTAX_ERROR) err.write(fault_line(oc) + "\n");
        return oc;
    }

    Denial d;
    std::string serr;
    if (!prescan(source, policy, &d, &serr)) {
        if (serr.rfind("MemoryError", 0) == 0) return memory_outcome();
        return internal_outcome("prescan: " + serr);
    }
    if (!d.name.empty()) {
        ScriptOutcome oc;
        oc.kind = RunKind::SECURITY_VIOLATION;
        oc.error_type = "CapabilityDenied";
        oc.message = "capability '" + d.name + "' not permitted";
        oc.line = d.line;
        return oc;
    }
    prog->reset(code.release());
    return ScriptOutcome{};
}

ScriptOutcome run_locked(PyObject* code, const CapabilityPolicy& policy, OutputSink& out, OutputSink& err,
                         const InterpreterOptions& opts) {
    RunState st;
    st.out = &out;
    st.policy = &policy;
    st.stdin_data = &opts.stdin_data;
    st.echo_prompt = opts.echo_prompt;

    PyRef globals(PyDict_New());
    PyRef builtins = restricted_builtins(policy);
    PyRef main_name(PyUnicode_FromString("__main__"));
    if (!globals || !builtins || !main_name ||
        PyDict_SetItemString(globals.get(), "__builtins__", builtins.get()) < 0 ||
        PyDict_SetItemString(globals.get(), "__name__", main_name.get()) < 0) {
        bool no_memory = PyErr_ExceptionMatches(PyExc_MemoryError);
        PyErr_Clear();
        return no_memory ? memory_outcome() : internal_outcome("cannot build namespace");
    }

    ScriptOutcome oc;
    {
        RunScope scope(&st, out, err, opts.max_call_depth);
        if (!scope.ok()) {
            PyErr_Clear();
            return internal_outcome("cannot install output streams");
        }
        PyRef result(PyEval_EvalCode(code, globals.get(), globals.get()));
        // a denial swallowed on its own line still ends the program as a violation
        if (!result || !st.violation.empty()) oc = fault_outcome(st);
        PyErr_Clear();
        // Closures and classes reference the globals; clearing breaks the
        // cycles. Finalizers still write to this run's sinks.
        PyDict_Clear(globals.get());
        globals = PyRef();
        PyGC_Collect();
        PyErr_Clear();
    }

    if (oc.kind == RunKind::RUNTIME_FAULT) err.write(fault_line(oc) + "\n");
    return oc;
}

} // namespace

bool runtime_initialize(const CapabilityPolicy& policy, std::string* err) {
    std::lock_guard<std::mutex> lk(g_init_mutex);
    if (g_ready) return true;
    if (!g_init_error.empty()) {
        *err = g_init_error;
        return false;
    }

    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);
    config.site_import = 0;
    config.install_signal_handlers = 0;
    config.write_bytecode = 0;
    config.user_site_directory = 0;
    PyStatus status = Py_InitializeFromConfig(&config);
    PyConfig_Clear(&config);
    if (PyStatus_Exception(status)) {
        g_init_error = std::string("python runtime: ") + (status.err_msg ? status.err_msg : "initialization failed");
        *err = g_init_error;
        return false;
    }

    bool ok = setup_runtime(policy, &g_init_error);
    // Release the GIL; every run takes it back through PyGILState_Ensure.
    (void)PyEval_SaveThread();
    if (!ok) {
        *err = g_init_error;
        return false;
    }
    g_ready = true;
    return true;
}

CompiledProgram::~CompiledProgram() { reset(nullptr); }

void CompiledProgram::reset(_object* code) {
    if (!code_ && !code) return;
    PyGILState_STATE gil = PyGILState_Ensure();
    Py_XDECREF(code_);
    code_ = code;
    PyGILState_Release(gil);
}

ScriptOutcome compile_script(const std::string& source, const CapabilityPolicy& policy, OutputSink& err,
                             CompiledProgram* prog) {
    std::string ierr;
    if (!runtime_initialize(policy, &ierr)) return internal_outcome(ierr);

    std::lock_guard<std::mutex> lk(g_run_mutex);
    PyGILState_STATE gil = PyGILState_Ensure();
    ScriptOutcome oc;
    try {
        oc = compile_locked(source, policy, err, prog);
    } catch (const std::bad_alloc&) {
        PyErr_Clear();
        oc = memory_outcome();
    }
    PyGILState_Release(gil);
    err.flush();
    return oc;
}

ScriptOutcome run_compiled(const CompiledProgram& prog, const CapabilityPolicy& policy, OutputSink& out,
                           OutputSink& err, const InterpreterOptions& opts) {
    if (!prog.ready()) return internal_outcome("program not compiled");

    std::lock_guard<std::mutex> lk(g_run_mutex);
    PyGILState_STATE gil = PyGILState_Ensure();
    ScriptOutcome oc;
    try {
        oc = run_locked(prog.code_, policy, out, err, opts);
    } catch (const std::bad_alloc&) {
        PyErr_Clear();
        oc = memory_outcome();
    }
    PyGILState_Release(gil);
    out.flush();
    err.flush();
    return oc;
}

ScriptOutcome run_script(const std::string& source, const CapabilityPolicy& policy,
                         OutputSink& out, OutputSink& err, const InterpreterOptions& opts) {
    CompiledProgram prog;
    ScriptOutcome oc = compile_script(source, policy, err, &prog);
    if (oc.kind != RunKind::OK) return oc;
    return run_compiled(prog, policy, out, err, opts);
}

} // namespace cordon::script
