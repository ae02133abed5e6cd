#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace modpack {

enum class Profile { DEV, PROD };

// Detect profile from MODPACK_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: generous tool timeouts, no event log
// PROD: tighter tool timeouts, event log under the work root
void apply_profile_defaults(Profile p);

struct ServiceConfig {
    std::string host{"0.0.0.0"};
    int port{3000};

    int64_t ttl_ms{60LL * 60 * 1000};          // artifact lifetime
    size_t size_limit{1000000};                // manifest ceiling, bytes
    int64_t sweep_interval_ms{30LL * 60 * 1000};

    std::string work_root;                     // parent of all workspaces
    std::string install_cmd{"bun install --no-save --no-progress"};
    std::string archive_cmd{"tar -czf"};
    int install_timeout_ms{10 * 60 * 1000};
    int archive_timeout_ms{5 * 60 * 1000};
    size_t diag_max_bytes{256 * 1024};

    std::string public_origin;                 // empty = derive from Host header
    std::string event_log_path;                // empty = disabled
    int max_conns{32};

    // HTTP body cap: a file payload plus pasted text plus multipart framing.
    size_t max_body_bytes() const { return size_limit * 2 + 64 * 1024; }
};

// Read every MODPACK_* override on top of the defaults above. Invalid numbers
// fall back to the default; values are clamped to sane minimums.
ServiceConfig load_config_from_env();

// Env helpers (missing or unparsable -> defv)
int64_t getenv_i64(const char* key, int64_t defv);
std::string getenv_str(const char* key, const std::string& defv);

} // namespace modpack
