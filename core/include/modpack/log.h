#pragma once

#include <json-c/json.h>

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace modpack {

// Append-only JSONL event log. One canonical (sorted-key) object per line:
//   {"event":..., "payload":{...}, "seq":N, "ts":"2026-01-01T00:00:00Z"}
// A default-constructed or path-less log is disabled and drops events.
class EventLog {
public:
    EventLog() = default;
    explicit EventLog(const std::string& path);

    bool enabled() const { return out_.is_open(); }
    const std::string& path() const { return path_; }

    // Takes ownership of payload (may be nullptr).
    void event(const std::string& name, json_object* payload);

private:
    std::mutex mu_;
    std::string path_;
    std::ofstream out_;
    uint64_t seq_{0};
};

// UTC "YYYY-MM-DDTHH:MM:SSZ"
std::string iso_now();

} // namespace modpack
