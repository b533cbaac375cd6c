#pragma once

// json_mini.h
//
// Small helper layer over json-c: an owning Doc handle plus typed field
// getters over parsed objects.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>

namespace mender::json_mini {

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

    explicit operator bool() const { return root != nullptr; }

    // Give up ownership (e.g. to attach to a parent object).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }
};

// Strict parse: the whole input must be one JSON value.
inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    return Doc{obj};
}

// Parse one JSON value starting at s[pos]; trailing text is ignored.
// *consumed receives the number of bytes the value spans.
inline Doc parse_prefix(const std::string& s, size_t pos, size_t* consumed) {
    if (pos >= s.size()) return Doc{};
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    const size_t len = std::min(s.size() - pos, static_cast<size_t>(INT_MAX));
    json_object* obj = json_tokener_parse_ex(tok, s.c_str() + pos, static_cast<int>(len));
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t end = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success || !obj) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    if (consumed) *consumed = end;
    return Doc{obj};
}

// Locate the first JSON object embedded in free text (log noise, code
// fences, prose) that carries required_key. Candidates are tried at every
// '{' in order.
inline Doc extract_object_with_key(const std::string& s, const char* required_key) {
    size_t pos = s.find('{');
    while (pos != std::string::npos) {
        size_t used = 0;
        Doc d = parse_prefix(s, pos, &used);
        if (d && json_object_is_type(d.root, json_type_object)) {
            json_object* v = nullptr;
            if (!required_key || json_object_object_get_ex(d.root, required_key, &v)) return d;
        }
        pos = s.find('{', pos + 1);
    }
    return Doc{};
}

// ---- field getters on parsed objects ----

inline json_object* get_field(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return nullptr;
    return v;
}

inline std::optional<std::string> get_string(json_object* o, const char* key) {
    json_object* v = get_field(o, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

inline std::optional<int64_t> get_int(json_object* o, const char* key) {
    json_object* v = get_field(o, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

// ---- output ----

inline std::string to_string(json_object* o, bool pretty = false) {
    if (!o) return "null";
    const int flags = (pretty ? JSON_C_TO_STRING_PRETTY : JSON_C_TO_STRING_PLAIN) | JSON_C_TO_STRING_NOSLASHESCAPE;
    return json_object_to_json_string_ext(o, flags);
}

inline json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.data(), static_cast<int>(s.size()));
}

} // namespace mender::json_mini
