#pragma once

// Private to the script runtime: Python.h must come before any standard header.
#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <string>

namespace cordon::script {

// Owning reference to a Python object.
class PyRef {
public:
    PyRef() = default;
    explicit PyRef(PyObject* o) : o_(o) {}  // steals
    ~PyRef() { Py_XDECREF(o_); }

    PyRef(const PyRef&) = delete;
    PyRef& operator=(const PyRef&) = delete;
    PyRef(PyRef&& other) noexcept : o_(other.o_) { other.o_ = nullptr; }
    PyRef& operator=(PyRef&& other) noexcept {
        if (this != &other) {
            Py_XDECREF(o_);
            o_ = other.o_;
            other.o_ = nullptr;
        }
        return *this;
    }

    static PyRef borrow(PyObject* o) {
        Py_XINCREF(o);
        return PyRef(o);
    }

    PyObject* get() const { return o_; }
    PyObject* release() {
        PyObject* o = o_;
        o_ = nullptr;
        return o;
    }
    explicit operator bool() const { return o_ != nullptr; }

private:
    PyObject* o_{nullptr};
};

// UTF-8 of a str object; empty (error cleared) when `o` is not a str.
inline std::string py_utf8(PyObject* o) {
    if (!o || !PyUnicode_Check(o)) return {};
    Py_ssize_t n = 0;
    const char* p = PyUnicode_AsUTF8AndSize(o, &n);
    if (!p) {
        PyErr_Clear();
        return {};
    }
    return std::string(p, (size_t)n);
}

// str(o) as UTF-8, empty when str() itself fails.
inline std::string py_str(PyObject* o) {
    if (!o) return {};
    PyRef s(PyObject_Str(o));
    if (!s) {
        PyErr_Clear();
        return {};
    }
    return py_utf8(s.get());
}

// Integer attribute, `fallback` when missing or not an int.
inline long py_attr_long(PyObject* o, const char* name, long fallback) {
    PyRef v(PyObject_GetAttrString(o, name));
    if (!v || !PyLong_Check(v.get())) {
        PyErr_Clear();
        return fallback;
    }
    long r = PyLong_AsLong(v.get());
    if (r == -1 && PyErr_Occurred()) {
        PyErr_Clear();
        return fallback;
    }
    return r;
}

} // namespace cordon::script
