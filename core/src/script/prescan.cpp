#include "pyref.h"

#include "cordon/script/interpreter.h"
#include "cordon/script/prescan.h"

#include <cctype>
#include <unordered_set>
#include <vector>

namespace cordon::script {

namespace {

// Node classes of the `ast` module the scan looks at. MatchAs and MatchStar
// are absent before 3.10.
struct AstClasses {
    PyRef Import, ImportFrom, Name, Attribute, Constant, Store, Del;
    PyRef FunctionDef, AsyncFunctionDef, ClassDef, arg, alias, ExceptHandler, MatchAs, MatchStar;

    bool load(PyObject* ast) {
        struct Slot {
            PyRef* ref;
            const char* name;
            bool required;
        };
        const Slot slots[] = {
            {&Import, "Import", true},
            {&ImportFrom, "ImportFrom", true},
            {&Name, "Name", true},
            {&Attribute, "Attribute", true},
            {&Constant, "Constant", true},
            {&Store, "Store", true},
            {&Del, "Del", true},
            {&FunctionDef, "FunctionDef", true},
            {&AsyncFunctionDef, "AsyncFunctionDef", true},
            {&ClassDef, "ClassDef", true},
            {&arg, "arg", true},
            {&alias, "alias", true},
            {&ExceptHandler, "ExceptHandler", true},
            {&MatchAs, "MatchAs", false},
            {&MatchStar, "MatchStar", false},
        };
        for (const auto& s : slots) {
            *s.ref = PyRef(PyObject_GetAttrString(ast, s.name));
            if (!*s.ref) {
                if (s.required) return false;
                PyErr_Clear();
            }
        }
        return true;
    }
};

bool is_a(PyObject* node, const PyRef& cls) {
    if (!cls) return false;
    int r = PyObject_IsInstance(node, cls.get());
    if (r < 0) {
        PyErr_Clear();
        return false;
    }
    return r == 1;
}

// Attribute that is a str, or empty when missing or None.
std::string str_attr(PyObject* node, const char* name) {
    PyRef v(PyObject_GetAttrString(node, name));
    if (!v) {
        PyErr_Clear();
        return {};
    }
    return py_utf8(v.get());
}

std::string error_text() {
    PyObject *type = nullptr, *value = nullptr, *tb = nullptr;
    PyErr_Fetch(&type, &value, &tb);
    PyErr_NormalizeException(&type, &value, &tb);
    PyRef t(type), v(value), b(tb);
    std::string name = type ? reinterpret_cast<PyTypeObject*>(type)->tp_name : "Error";
    std::string msg = py_str(v.get());
    return msg.empty() ? name : name + ": " + msg;
}

bool is_ident(char c) {
    return std::isalnum((unsigned char)c) || c == '_';
}

// First attribute named inside a str.format replacement field, such as the
// `__class__` of "{0.__class__}", that the policy does not permit.
bool format_field_attribute(const std::string& s, const CapabilityPolicy& policy, std::string* name) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '{') continue;
        if (i + 1 < s.size() && s[i + 1] == '{') {
            ++i;
            continue;
        }
        size_t j = i + 1;
        while (j < s.size() && s[j] != '}' && s[j] != '!' && s[j] != ':') {
            if (s[j] != '.') {
                ++j;
                continue;
            }
            size_t k = j + 1;
            while (k < s.size() && is_ident(s[k])) ++k;
            std::string attr = s.substr(j + 1, k - j - 1);
            if (!policy.permits_attribute(attr)) {
                *name = attr;
                return true;
            }
            j = k;
        }
        i = j;
    }
    return false;
}

class Scanner {
public:
    explicit Scanner(const CapabilityPolicy& policy) : policy_(policy) {
        for (const auto& n : builtin_names()) {
            if (!policy_.permits_builtin(n)) denied_builtins_.insert(n);
        }
    }

    bool run(const std::string& source, Denial* out, std::string* err) {
        PyRef ast(PyImport_ImportModule("ast"));
        if (!ast || !cls_.load(ast.get())) {
            *err = error_text();
            return false;
        }
        PyRef tree(PyObject_CallMethod(ast.get(), "parse", "s#s", source.data(), (Py_ssize_t)source.size(),
                                       "<program>"));
        if (!tree) {
            if (PyErr_ExceptionMatches(PyExc_SyntaxError) || PyErr_ExceptionMatches(PyExc_ValueError) ||
                PyErr_ExceptionMatches(PyExc_RecursionError)) {
                PyErr_Clear();
                return true;
            }
            *err = error_text();
            return false;
        }
        PyRef walk(PyObject_CallMethod(ast.get(), "walk", "O", tree.get()));
        PyRef nodes(walk ? PySequence_List(walk.get()) : nullptr);
        if (!nodes) {
            *err = error_text();
            return false;
        }

        Py_ssize_t n = PyList_GET_SIZE(nodes.get());
        for (Py_ssize_t i = 0; i < n; ++i) collect_binding(PyList_GET_ITEM(nodes.get(), i));
        for (Py_ssize_t i = 0; i < n; ++i) check(PyList_GET_ITEM(nodes.get(), i));

        if (found_) {
            out->name = first_.name;
            out->line = first_.line;
        }
        return true;
    }

private:
    const CapabilityPolicy& policy_;
    AstClasses cls_;
    std::unordered_set<std::string> denied_builtins_;
    std::unordered_set<std::string> bound_;
    bool found_{false};
    Denial first_;
    int first_col_{0};

    void bind(const std::string& name) {
        if (!name.empty()) bound_.insert(name);
    }

    void collect_binding(PyObject* node) {
        if (is_a(node, cls_.Name)) {
            PyRef ctx(PyObject_GetAttrString(node, "ctx"));
            if (!ctx) {
                PyErr_Clear();
                return;
            }
            if (is_a(ctx.get(), cls_.Store) || is_a(ctx.get(), cls_.Del)) bind(str_attr(node, "id"));
        } else if (is_a(node, cls_.FunctionDef) || is_a(node, cls_.AsyncFunctionDef) || is_a(node, cls_.ClassDef)) {
            bind(str_attr(node, "name"));
        } else if (is_a(node, cls_.arg)) {
            bind(str_attr(node, "arg"));
        } else if (is_a(node, cls_.alias)) {
            std::string as = str_attr(node, "asname");
            if (as.empty()) {
                std::string name = str_attr(node, "name");
                as = name.substr(0, name.find('.'));
            }
            bind(as);
        } else if (is_a(node, cls_.ExceptHandler) || is_a(node, cls_.MatchAs) || is_a(node, cls_.MatchStar)) {
            bind(str_attr(node, "name"));
        }
    }

    void deny(PyObject* node, const std::string& name) {
        int line = (int)py_attr_long(node, "lineno", 0);
        int col = (int)py_attr_long(node, "col_offset", 0);
        if (found_ && (line > first_.line || (line == first_.line && col >= first_col_))) return;
        found_ = true;
        first_.name = name;
        first_.line = line;
        first_col_ = col;
    }

    void check_aliases(PyObject* node, bool from_import) {
        PyRef names(PyObject_GetAttrString(node, "names"));
        if (!names || !PyList_Check(names.get())) {
            PyErr_Clear();
            return;
        }
        for (Py_ssize_t i = 0; i < PyList_GET_SIZE(names.get()); ++i) {
            std::string name = str_attr(PyList_GET_ITEM(names.get(), i), "name");
            if (from_import) {
                if (!policy_.permits_attribute(name)) deny(node, name);
            } else if (!policy_.permits_module(name)) {
                deny(node, CapabilityPolicy::denied_module_name(name, policy_));
            }
        }
    }

    void check(PyObject* node) {
        if (is_a(node, cls_.Import)) {
            check_aliases(node, false);
        } else if (is_a(node, cls_.ImportFrom)) {
            std::string module = str_attr(node, "module");
            long level = py_attr_long(node, "level", 0);
            if (level > 0) {
                deny(node, std::string((size_t)level, '.') + module);
            } else if (!policy_.permits_module(module)) {
                deny(node, CapabilityPolicy::denied_module_name(module, policy_));
            }
            check_aliases(node, true);
        } else if (is_a(node, cls_.Name)) {
            std::string id = str_attr(node, "id");
            if (denied_builtins_.count(id) && !bound_.count(id)) deny(node, id);
        } else if (is_a(node, cls_.Attribute)) {
            std::string attr = str_attr(node, "attr");
            if (!policy_.permits_attribute(attr)) deny(node, attr);
        } else if (is_a(node, cls_.Constant)) {
            PyRef value(PyObject_GetAttrString(node, "value"));
            if (!value) {
                PyErr_Clear();
                return;
            }
            std::string field;
            if (PyUnicode_Check(value.get()) &&
                format_field_attribute(py_utf8(value.get()), policy_, &field)) {
                deny(node, field);
            }
        }
    }
};

} // namespace

bool prescan(const std::string& source, const CapabilityPolicy& policy, Denial* out, std::string* err) {
    if (!runtime_initialize(policy, err)) return false;
    *out = Denial{};
    PyGILState_STATE gil = PyGILState_Ensure();
    bool ok = Scanner(policy).run(source, out, err);
    PyGILState_Release(gil);
    return ok;
}

} // namespace cordon::script
