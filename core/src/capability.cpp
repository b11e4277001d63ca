#include "cordon/capability.h"

#include <iterator>
#include <unordered_map>
#include <unordered_set>

namespace cordon {

namespace {

struct Entry {
    const char* name;
    Capability cap;
};

const Entry kBuiltins[] = {
    // console
    {"print", Capability::CONSOLE},
    {"input", Capability::CONSOLE},
    // numbers
    {"int", Capability::ARITHMETIC},
    {"float", Capability::ARITHMETIC},
    {"complex", Capability::ARITHMETIC},
    {"bool", Capability::ARITHMETIC},
    {"abs", Capability::ARITHMETIC},
    {"round", Capability::ARITHMETIC},
    {"divmod", Capability::ARITHMETIC},
    {"pow", Capability::ARITHMETIC},
    {"hex", Capability::ARITHMETIC},
    {"bin", Capability::ARITHMETIC},
    {"oct", Capability::ARITHMETIC},
    {"hash", Capability::ARITHMETIC},
    // text
    {"str", Capability::TEXT},
    {"repr", Capability::TEXT},
    {"ascii", Capability::TEXT},
    {"ord", Capability::TEXT},
    {"chr", Capability::TEXT},
    {"format", Capability::TEXT},
    {"bytes", Capability::TEXT},
    {"bytearray", Capability::TEXT},
    // collections, iteration and user-defined types
    {"len", Capability::COLLECTIONS},
    {"range", Capability::COLLECTIONS},
    {"list", Capability::COLLECTIONS},
    {"tuple", Capability::COLLECTIONS},
    {"dict", Capability::COLLECTIONS},
    {"set", Capability::COLLECTIONS},
    {"frozenset", Capability::COLLECTIONS},
    {"slice", Capability::COLLECTIONS},
    {"min", Capability::COLLECTIONS},
    {"max", Capability::COLLECTIONS},
    {"sum", Capability::COLLECTIONS},
    {"sorted", Capability::COLLECTIONS},
    {"reversed", Capability::COLLECTIONS},
    {"enumerate", Capability::COLLECTIONS},
    {"zip", Capability::COLLECTIONS},
    {"map", Capability::COLLECTIONS},
    {"filter", Capability::COLLECTIONS},
    {"iter", Capability::COLLECTIONS},
    {"next", Capability::COLLECTIONS},
    {"any", Capability::COLLECTIONS},
    {"all", Capability::COLLECTIONS},
    {"callable", Capability::COLLECTIONS},
    {"type", Capability::COLLECTIONS},
    {"isinstance", Capability::COLLECTIONS},
    {"issubclass", Capability::COLLECTIONS},
    {"id", Capability::COLLECTIONS},
    {"object", Capability::COLLECTIONS},
    {"super", Capability::COLLECTIONS},
    {"property", Capability::COLLECTIONS},
    {"classmethod", Capability::COLLECTIONS},
    {"staticmethod", Capability::COLLECTIONS},
    {"__build_class__", Capability::COLLECTIONS},
    {"NotImplemented", Capability::COLLECTIONS},
    {"Ellipsis", Capability::COLLECTIONS},
    // exception types
    {"BaseException", Capability::COLLECTIONS},
    {"Exception", Capability::COLLECTIONS},
    {"SystemExit", Capability::COLLECTIONS},
    {"KeyboardInterrupt", Capability::COLLECTIONS},
    {"GeneratorExit", Capability::COLLECTIONS},
    {"ArithmeticError", Capability::COLLECTIONS},
    {"ZeroDivisionError", Capability::COLLECTIONS},
    {"OverflowError", Capability::COLLECTIONS},
    {"FloatingPointError", Capability::COLLECTIONS},
    {"LookupError", Capability::COLLECTIONS},
    {"IndexError", Capability::COLLECTIONS},
    {"KeyError", Capability::COLLECTIONS},
    {"ValueError", Capability::COLLECTIONS},
    {"UnicodeError", Capability::COLLECTIONS},
    {"UnicodeDecodeError", Capability::COLLECTIONS},
    {"UnicodeEncodeError", Capability::COLLECTIONS},
    {"TypeError", Capability::COLLECTIONS},
    {"NameError", Capability::COLLECTIONS},
    {"UnboundLocalError", Capability::COLLECTIONS},
    {"AttributeError", Capability::COLLECTIONS},
    {"RuntimeError", Capability::COLLECTIONS},
    {"RecursionError", Capability::COLLECTIONS},
    {"NotImplementedError", Capability::COLLECTIONS},
    {"AssertionError", Capability::COLLECTIONS},
    {"MemoryError", Capability::COLLECTIONS},
    {"EOFError", Capability::COLLECTIONS},
    {"StopIteration", Capability::COLLECTIONS},
    {"ImportError", Capability::COLLECTIONS},
    {"ModuleNotFoundError", Capability::COLLECTIONS},
    {"SyntaxError", Capability::COLLECTIONS},
    {"IndentationError", Capability::COLLECTIONS},
    {"OSError", Capability::COLLECTIONS},
    {"TimeoutError", Capability::COLLECTIONS},
    {"Warning", Capability::COLLECTIONS},
    {"UserWarning", Capability::COLLECTIONS},

    // privileged
    {"open", Capability::FILESYSTEM},
    {"exec", Capability::DYNAMIC_CODE},
    {"eval", Capability::DYNAMIC_CODE},
    {"compile", Capability::DYNAMIC_CODE},
    {"__import__", Capability::DYNAMIC_CODE},
    {"globals", Capability::INTROSPECTION},
    {"locals", Capability::INTROSPECTION},
    {"vars", Capability::INTROSPECTION},
    {"getattr", Capability::INTROSPECTION},
    {"setattr", Capability::INTROSPECTION},
    {"delattr", Capability::INTROSPECTION},
    {"hasattr", Capability::INTROSPECTION},
    {"dir", Capability::INTROSPECTION},
    {"help", Capability::INTROSPECTION},
    {"memoryview", Capability::NATIVE_CODE},
    {"aiter", Capability::THREADS},
    {"anext", Capability::THREADS},
    {"exit", Capability::INTERPRETER_CONTROL},
    {"quit", Capability::INTERPRETER_CONTROL},
    {"breakpoint", Capability::INTERPRETER_CONTROL},
    {"copyright", Capability::INTERPRETER_CONTROL},
    {"credits", Capability::INTERPRETER_CONTROL},
    {"license", Capability::INTERPRETER_CONTROL},
};

// Special methods a class may define and call through super(). Every other
// dunder attribute reaches interpreter internals.
const char* const kSpecialMethods[] = {
    "__init__", "__str__", "__repr__", "__len__", "__iter__", "__next__", "__contains__",
    "__getitem__", "__setitem__", "__delitem__", "__eq__", "__ne__", "__lt__", "__le__",
    "__gt__", "__ge__", "__hash__", "__bool__", "__call__", "__add__", "__sub__", "__mul__",
    "__truediv__", "__floordiv__", "__mod__", "__pow__", "__neg__", "__pos__", "__abs__",
    "__radd__", "__rsub__", "__rmul__", "__name__", "__doc__",
};

const Entry kModules[] = {
    {"math", Capability::MATH},
    {"string", Capability::STRING_CONSTANTS},

    {"os", Capability::PROCESS},
    {"posix", Capability::PROCESS},
    {"subprocess", Capability::PROCESS},
    {"signal", Capability::PROCESS},
    {"pty", Capability::PROCESS},
    {"resource", Capability::PROCESS},
    {"io", Capability::FILESYSTEM},
    {"pathlib", Capability::FILESYSTEM},
    {"shutil", Capability::FILESYSTEM},
    {"glob", Capability::FILESYSTEM},
    {"tempfile", Capability::FILESYSTEM},
    {"fileinput", Capability::FILESYSTEM},
    {"socket", Capability::NETWORK},
    {"ssl", Capability::NETWORK},
    {"http", Capability::NETWORK},
    {"urllib", Capability::NETWORK},
    {"ftplib", Capability::NETWORK},
    {"smtplib", Capability::NETWORK},
    {"requests", Capability::NETWORK},
    {"environ", Capability::ENVIRONMENT},
    {"sys", Capability::INTERPRETER_CONTROL},
    {"ast", Capability::DYNAMIC_CODE},
    {"atexit", Capability::INTERPRETER_CONTROL},
    {"builtins", Capability::INTROSPECTION},
    {"inspect", Capability::INTROSPECTION},
    {"gc", Capability::INTROSPECTION},
    {"types", Capability::INTROSPECTION},
    {"importlib", Capability::DYNAMIC_CODE},
    {"pickle", Capability::DYNAMIC_CODE},
    {"marshal", Capability::DYNAMIC_CODE},
    {"code", Capability::DYNAMIC_CODE},
    {"codeop", Capability::DYNAMIC_CODE},
    {"runpy", Capability::DYNAMIC_CODE},
    {"ctypes", Capability::NATIVE_CODE},
    {"cffi", Capability::NATIVE_CODE},
    {"mmap", Capability::NATIVE_CODE},
    {"threading", Capability::THREADS},
    {"_thread", Capability::THREADS},
    {"multiprocessing", Capability::THREADS},
    {"concurrent", Capability::THREADS},
    {"asyncio", Capability::THREADS},
};

template <size_t N>
std::unordered_map<std::string, Capability> index_of(const Entry (&table)[N]) {
    std::unordered_map<std::string, Capability> m;
    for (const auto& e : table) m.emplace(e.name, e.cap);
    return m;
}

uint32_t bit(Capability c) { return 1u << static_cast<unsigned>(c); }

} // namespace

const char* capability_to_str(Capability c) {
    switch (c) {
        case Capability::ARITHMETIC: return "ARITHMETIC";
        case Capability::TEXT: return "TEXT";
        case Capability::COLLECTIONS: return "COLLECTIONS";
        case Capability::CONSOLE: return "CONSOLE";
        case Capability::MATH: return "MATH";
        case Capability::STRING_CONSTANTS: return "STRING_CONSTANTS";
        case Capability::FILESYSTEM: return "FILESYSTEM";
        case Capability::PROCESS: return "PROCESS";
        case Capability::NETWORK: return "NETWORK";
        case Capability::ENVIRONMENT: return "ENVIRONMENT";
        case Capability::DYNAMIC_CODE: return "DYNAMIC_CODE";
        case Capability::INTROSPECTION: return "INTROSPECTION";
        case Capability::NATIVE_CODE: return "NATIVE_CODE";
        case Capability::THREADS: return "THREADS";
        case Capability::INTERPRETER_CONTROL: return "INTERPRETER_CONTROL";
    }
    return "UNKNOWN";
}

bool capability_is_pure(Capability c) {
    switch (c) {
        case Capability::ARITHMETIC:
        case Capability::TEXT:
        case Capability::COLLECTIONS:
        case Capability::CONSOLE:
        case Capability::MATH:
        case Capability::STRING_CONSTANTS:
            return true;
        default:
            return false;
    }
}

bool builtin_capability(const std::string& name, Capability* out) {
    static const auto table = index_of(kBuiltins);
    auto it = table.find(name);
    if (it == table.end()) return false;
    if (out) *out = it->second;
    return true;
}

bool module_capability(const std::string& name, Capability* out) {
    static const auto table = index_of(kModules);
    auto it = table.find(name);
    if (it == table.end()) return false;
    if (out) *out = it->second;
    return true;
}

template <size_t N>
std::vector<std::string> names_of(const Entry (&table)[N]) {
    std::vector<std::string> v;
    v.reserve(N);
    for (const auto& e : table) v.emplace_back(e.name);
    return v;
}

std::vector<std::string> builtin_names() { return names_of(kBuiltins); }
std::vector<std::string> module_names() { return names_of(kModules); }

bool is_dunder(const std::string& name) {
    return name.size() >= 2 && name[0] == '_' && name[1] == '_';
}

CapabilityPolicy CapabilityPolicy::pure_default() {
    CapabilityPolicy p;
    for (Capability c : {Capability::ARITHMETIC, Capability::TEXT, Capability::COLLECTIONS,
                         Capability::CONSOLE, Capability::MATH, Capability::STRING_CONSTANTS}) {
        p.permit(c);
    }
    return p;
}

void CapabilityPolicy::permit(Capability c) { mask_ |= bit(c); }
void CapabilityPolicy::revoke(Capability c) { mask_ &= ~bit(c); }
bool CapabilityPolicy::is_permitted(Capability c) const { return (mask_ & bit(c)) != 0; }

bool CapabilityPolicy::permits_builtin(const std::string& name) const {
    Capability c;
    if (!builtin_capability(name, &c)) return false;
    return is_permitted(c);
}

bool CapabilityPolicy::permits_module(const std::string& name) const {
    // Only flat modules are provided; submodule imports are not reachable.
    if (name.find('.') != std::string::npos) return false;
    Capability c;
    if (!module_capability(name, &c)) return false;
    return is_permitted(c);
}

bool CapabilityPolicy::permits_attribute(const std::string& name) const {
    static const std::unordered_set<std::string> special(std::begin(kSpecialMethods), std::end(kSpecialMethods));
    if (!is_dunder(name)) return true;
    return special.count(name) > 0;
}

std::string CapabilityPolicy::denied_module_name(const std::string& module, const CapabilityPolicy& p) {
    std::string top = module.substr(0, module.find('.'));
    if (!p.permits_module(top)) return top;
    return module;
}

} // namespace cordon
