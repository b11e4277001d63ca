#pragma once

// json_mini.h
//
// Thin helpers over json-c: an owning document handle, typed field lookups
// that keep embedded NUL bytes, and sorted-key serialization.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace cordon::json_mini {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    // Hand ownership to the caller.
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse: the whole input must be exactly one JSON value.
inline Doc parse(const std::string& json) {
    if (json.size() > static_cast<size_t>(INT_MAX)) return Doc{};
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(), static_cast<int>(json.size()));
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    for (size_t i = consumed; i < json.size(); i++) {
        char c = json[i];
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            json_object_put(obj);
            return Doc{};
        }
    }
    return Doc{obj};
}

inline json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.data(), static_cast<int>(std::min(s.size(), static_cast<size_t>(INT_MAX))));
}

inline bool is_object(json_object* o) { return o && json_object_is_type(o, json_type_object); }

// Field lookups. `present` distinguishes a missing key from a mistyped one:
// they return false when the key exists with the wrong type.
inline bool get_string(json_object* o, const char* k, std::string* out, bool* present = nullptr) {
    json_object* v = nullptr;
    bool has = is_object(o) && json_object_object_get_ex(o, k, &v) && v;
    if (present) *present = has;
    if (!has) return false;
    if (!json_object_is_type(v, json_type_string)) return false;
    *out = std::string(json_object_get_string(v), static_cast<size_t>(json_object_get_string_len(v)));
    return true;
}

inline bool get_int(json_object* o, const char* k, int64_t* out, bool* present = nullptr) {
    json_object* v = nullptr;
    bool has = is_object(o) && json_object_object_get_ex(o, k, &v) && v;
    if (present) *present = has;
    if (!has) return false;
    if (!json_object_is_type(v, json_type_int)) return false;
    *out = static_cast<int64_t>(json_object_get_int64(v));
    return true;
}

inline bool get_bool(json_object* o, const char* k, bool* out, bool* present = nullptr) {
    json_object* v = nullptr;
    bool has = is_object(o) && json_object_object_get_ex(o, k, &v) && v;
    if (present) *present = has;
    if (!has) return false;
    if (!json_object_is_type(v, json_type_boolean)) return false;
    *out = json_object_get_boolean(v) != 0;
    return true;
}

inline json_object* get_field(json_object* o, const char* k) {
    json_object* v = nullptr;
    if (!is_object(o) || !json_object_object_get_ex(o, k, &v)) return nullptr;
    return v;
}

// Recursively serialize with sorted object keys.
inline void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) {
        out << "null";
        return;
    }
    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());
        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = new_string(keys[i]);
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
        break;
    }
}

inline std::string to_string(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

} // namespace cordon::json_mini
