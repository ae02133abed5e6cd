#pragma once

// json_doc.h
//
// Thin RAII layer over json-c. Everything that parses or emits JSON in
// modpack (manifest validation, event log lines, /health) goes through here.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace modpack::json_doc {

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

    // Hands ownership to the caller (e.g. to attach under another object).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }
};

struct ParseResult {
    Doc doc;
    bool ok{false};
    std::string error; // json-c tokener description when !ok
};

// Nesting allowed before a document is rejected (json-c defaults to 32).
inline constexpr int kMaxDepth = 512;

// Strict RFC 8259 parse of the whole buffer: no comments, single quotes,
// trailing commas or NaN/Infinity. Trailing garbage after the first value
// is a failure; a literal JSON null is reported as ok with an empty Doc.
inline ParseResult parse(const std::string& json) {
    ParseResult r;
    json_tokener* tok = json_tokener_new_ex(kMaxDepth);
    if (!tok) {
        r.error = "tokener allocation failed";
        return r;
    }
    json_tokener_set_flags(tok, JSON_TOKENER_STRICT);
    const int len = static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX)));
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(), len);
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);

    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        r.error = json_tokener_error_desc(jerr);
        return r;
    }
    for (size_t i = consumed; i < json.size(); i++) {
        char c = json[i];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') continue;
        if (obj) json_object_put(obj);
        r.error = "unexpected trailing data";
        return r;
    }
    r.doc = Doc{obj};
    r.ok = true;
    return r;
}

inline void add_string(json_object* obj, const char* key, const std::string& v) {
    json_object_object_add(obj, key,
        json_object_new_string_len(v.c_str(), static_cast<int>(std::min(v.size(), static_cast<size_t>(INT_MAX)))));
}

inline void add_int(json_object* obj, const char* key, int64_t v) {
    json_object_object_add(obj, key, json_object_new_int64(v));
}

inline void add_bool(json_object* obj, const char* key, bool v) {
    json_object_object_add(obj, key, json_object_new_boolean(v ? 1 : 0));
}

// Serialize with object keys sorted so identical events produce identical lines.
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
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
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
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

inline std::string to_canonical(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

} // namespace modpack::json_doc
