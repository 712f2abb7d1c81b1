#pragma once

// json_mini.h
//
// Thin helpers over json-c: an owning document handle, tolerant field
// accessors for third-party report schemas, and canonical (sorted-key)
// serialisation used for content hashing and the event log.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace patchbench::json_mini {

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

    // Transfer ownership to the caller.
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse: the whole buffer must be one JSON value (trailing whitespace allowed).
inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    const int len = static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX)));
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(), len);
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    for (size_t i = consumed; i < json.size(); i++) {
        char c = json[i];
        if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
            if (obj) json_object_put(obj);
            return Doc{};
        }
    }
    return Doc{obj};
}

inline json_object* field(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return nullptr;
    return v;
}

inline bool has(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return false;
    return json_object_object_get_ex(o, key, nullptr) != 0;
}

inline std::optional<std::string> get_string(json_object* o, const char* key) {
    json_object* v = field(o, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

inline std::string get_string_or(json_object* o, const char* key, const std::string& defv) {
    auto v = get_string(o, key);
    return v ? *v : defv;
}

// Accepts integers, doubles and numeric strings ("12", "0.5s").
inline std::optional<double> get_number(json_object* o, const char* key) {
    json_object* v = field(o, key);
    if (!v) return std::nullopt;
    if (json_object_is_type(v, json_type_int) || json_object_is_type(v, json_type_double)) {
        return json_object_get_double(v);
    }
    if (json_object_is_type(v, json_type_string)) {
        const char* s = json_object_get_string(v);
        char* end = nullptr;
        double d = std::strtod(s, &end);
        if (end == s) return std::nullopt;
        return d;
    }
    return std::nullopt;
}

// Numbers that are not finite or do not fit int64_t yield defv.
inline int64_t get_int_or(json_object* o, const char* key, int64_t defv) {
    auto v = get_number(o, key);
    if (!v || !std::isfinite(*v)) return defv;
    // 2^63 is exact as a double; INT64_MAX is not
    if (*v >= 9223372036854775808.0 || *v < -9223372036854775808.0) return defv;
    return static_cast<int64_t>(*v);
}

inline std::optional<bool> get_bool(json_object* o, const char* key) {
    json_object* v = field(o, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

inline json_object* get_array(json_object* o, const char* key) {
    json_object* v = field(o, key);
    if (!v || !json_object_is_type(v, json_type_array)) return nullptr;
    return v;
}

inline json_object* get_object(json_object* o, const char* key) {
    json_object* v = field(o, key);
    if (!v || !json_object_is_type(v, json_type_object)) return nullptr;
    return v;
}

inline std::vector<std::string> get_array_strings(json_object* o, const char* key) {
    std::vector<std::string> out;
    json_object* arr = get_array(o, key);
    if (!arr) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

inline json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), static_cast<int>(s.size()));
}

inline json_object* new_string_array(const std::vector<std::string>& items) {
    json_object* arr = json_object_new_array();
    for (const auto& s : items) json_object_array_add(arr, new_string(s));
    return arr;
}

inline std::string to_string_plain(json_object* o) {
    return json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
}

// Serialize with object keys sorted at every level. Deterministic for hashing.
inline void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }
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
            out << to_string_plain(ks);
            json_object_put(ks);
            out << ":";
            canonical_serialize(field(obj, keys[i].c_str()), out);
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
        out << to_string_plain(obj);
        break;
    }
}

inline std::string canonical(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

} // namespace patchbench::json_mini
