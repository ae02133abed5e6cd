#include "modpack/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace modpack {

Profile detect_profile() {
    const char* env = std::getenv("MODPACK_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("MODPACK_INSTALL_TIMEOUT_MS", "900000", NO_OVERWRITE);
            setenv("MODPACK_ARCHIVE_TIMEOUT_MS", "600000", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("MODPACK_INSTALL_TIMEOUT_MS", "300000", NO_OVERWRITE);
            setenv("MODPACK_ARCHIVE_TIMEOUT_MS", "120000", NO_OVERWRITE);
            setenv("MODPACK_MAX_CONNS",          "64",     NO_OVERWRITE);
            if (!std::getenv("MODPACK_EVENT_LOG")) {
                std::string root = getenv_str("MODPACK_WORK_ROOT", "");
                if (root.empty()) root = (std::filesystem::temp_directory_path() / "modpack").string();
                setenv("MODPACK_EVENT_LOG", (root + "/events.jsonl").c_str(), NO_OVERWRITE);
            }
            break;
    }
}

int64_t getenv_i64(const char* key, int64_t defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    try {
        size_t used = 0;
        long long n = std::stoll(v, &used);
        if (used != std::string(v).size()) return defv;
        return (int64_t)n;
    } catch (const std::exception&) {
        return defv;
    }
}

std::string getenv_str(const char* key, const std::string& defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    return v;
}

ServiceConfig load_config_from_env() {
    ServiceConfig c;
    c.host = getenv_str("MODPACK_HOST", c.host);
    c.port = (int)getenv_i64("MODPACK_PORT", getenv_i64("PORT", c.port));
    if (c.port <= 0 || c.port > 65535) c.port = 3000;

    c.ttl_ms = std::max<int64_t>(1000, getenv_i64("MODPACK_TTL_MS", c.ttl_ms));
    c.sweep_interval_ms = std::max<int64_t>(1000, getenv_i64("MODPACK_SWEEP_MS", c.sweep_interval_ms));
    c.size_limit = (size_t)std::max<int64_t>(1, getenv_i64("MODPACK_SIZE_LIMIT", (int64_t)c.size_limit));

    c.work_root = getenv_str("MODPACK_WORK_ROOT",
                             (std::filesystem::temp_directory_path() / "modpack").string());
    c.install_cmd = getenv_str("MODPACK_INSTALL_CMD", c.install_cmd);
    c.archive_cmd = getenv_str("MODPACK_ARCHIVE_CMD", c.archive_cmd);
    c.install_timeout_ms = (int)std::max<int64_t>(0, getenv_i64("MODPACK_INSTALL_TIMEOUT_MS", c.install_timeout_ms));
    c.archive_timeout_ms = (int)std::max<int64_t>(0, getenv_i64("MODPACK_ARCHIVE_TIMEOUT_MS", c.archive_timeout_ms));
    c.diag_max_bytes = (size_t)std::max<int64_t>(1024, getenv_i64("MODPACK_DIAG_MAX_BYTES", (int64_t)c.diag_max_bytes));

    c.public_origin = getenv_str("MODPACK_PUBLIC_ORIGIN", "");
    while (!c.public_origin.empty() && c.public_origin.back() == '/') c.public_origin.pop_back();
    c.event_log_path = getenv_str("MODPACK_EVENT_LOG", "");
    c.max_conns = (int)std::clamp<int64_t>(getenv_i64("MODPACK_MAX_CONNS", c.max_conns), 1, 1024);
    return c;
}

} // namespace modpack
