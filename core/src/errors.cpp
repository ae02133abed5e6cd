#include "modpack/errors.h"

namespace modpack {

const char* failure_kind_name(FailureKind k) {
    switch (k) {
        case FailureKind::NONE:            return "none";
        case FailureKind::MISSING_INPUT:   return "missing_input";
        case FailureKind::TOO_LARGE:       return "too_large";
        case FailureKind::MALFORMED_INPUT: return "malformed_input";
        case FailureKind::PROVISION:       return "provision";
        case FailureKind::BUILD_TOOL:      return "build_tool";
        case FailureKind::ARCHIVE_TOOL:    return "archive_tool";
        case FailureKind::INTERNAL:        return "internal";
    }
    return "internal";
}

} // namespace modpack
