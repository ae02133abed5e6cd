#pragma once

#include "errors.h"

#include <cstddef>
#include <string>

namespace modpack {

// Manifest as it arrives from a client: an uploaded file, pasted text, or both.
struct ManifestInput {
    std::string pasted_text;
    std::string file_content;
    bool has_file{false};
};

struct ManifestCheck {
    FailureKind kind{FailureKind::NONE};
    std::string content; // the effective manifest when kind == NONE
    std::string message; // client-facing reason otherwise
};

// Pick the effective source and validate it:
//   - pasted text (trimmed) wins when non-empty, else the file payload
//   - neither present            -> MISSING_INPUT
//   - effective size > limit     -> TOO_LARGE
//   - not a JSON object          -> MALFORMED_INPUT
// Performs no I/O.
ManifestCheck check_manifest(const ManifestInput& in, size_t size_limit);

std::string trim_ws(const std::string& s);

} // namespace modpack
