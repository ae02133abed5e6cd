#pragma once

#include <stdexcept>
#include <string>

namespace modpack {

// Environment-level failures (disk, permissions). Surfaced to clients as an
// internal failure and logged for the operator.
class ProvisionError : public std::runtime_error {
public:
    explicit ProvisionError(const std::string& what) : std::runtime_error(what) {}
};

class WriteError : public std::runtime_error {
public:
    explicit WriteError(const std::string& what) : std::runtime_error(what) {}
};

enum class FailureKind {
    NONE,
    MISSING_INPUT,
    TOO_LARGE,
    MALFORMED_INPUT,
    PROVISION,
    BUILD_TOOL,
    ARCHIVE_TOOL,
    INTERNAL,
};

const char* failure_kind_name(FailureKind k);

// Client-correctable input problems (never logged as incidents).
inline bool is_input_error(FailureKind k) {
    return k == FailureKind::MISSING_INPUT || k == FailureKind::TOO_LARGE ||
           k == FailureKind::MALFORMED_INPUT;
}

} // namespace modpack
