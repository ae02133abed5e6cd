#include "modpack/manifest.h"
#include "modpack/json_doc.h"

namespace modpack {

std::string trim_ws(const std::string& s) {
    size_t b = 0, e = s.size();
    auto ws = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    while (b < e && ws(s[b])) b++;
    while (e > b && ws(s[e - 1])) e--;
    return s.substr(b, e - b);
}

ManifestCheck check_manifest(const ManifestInput& in, size_t size_limit) {
    ManifestCheck r;

    std::string pasted = trim_ws(in.pasted_text);
    if (!pasted.empty()) {
        if (pasted.size() > size_limit) {
            r.kind = FailureKind::TOO_LARGE;
            r.message = "JSON too large (" + std::to_string(size_limit) + " byte limit).";
            return r;
        }
        r.content = std::move(pasted);
    } else {
        if (!in.has_file || in.file_content.empty()) {
            r.kind = FailureKind::MISSING_INPUT;
            r.message = "No package.json provided.";
            return r;
        }
        if (in.file_content.size() > size_limit) {
            r.kind = FailureKind::TOO_LARGE;
            r.message = "File too large (" + std::to_string(size_limit) + " byte limit).";
            return r;
        }
        r.content = in.file_content;
    }

    auto parsed = json_doc::parse(r.content);
    if (!parsed.ok || !parsed.doc || !json_object_is_type(parsed.doc.root, json_type_object)) {
        r.kind = FailureKind::MALFORMED_INPUT;
        r.message = "Invalid JSON.";
        r.content.clear();
        return r;
    }
    return r;
}

} // namespace modpack
