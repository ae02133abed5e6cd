#include "modpack/log.h"
#include "modpack/json_doc.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace modpack {

std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

EventLog::EventLog(const std::string& path) : path_(path) {
    if (path_.empty()) return;
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        std::cerr << "[WARN] event log disabled, cannot open " << path_ << "\n";
    }
}

void EventLog::event(const std::string& name, json_object* payload) {
    json_doc::Doc p(payload);
    if (!out_.is_open()) return;

    json_doc::Doc rec(json_object_new_object());
    json_doc::add_string(rec.root, "event", name);
    json_object_object_add(rec.root, "payload", p ? p.release() : json_object_new_object());
    json_doc::add_string(rec.root, "ts", iso_now());

    std::lock_guard<std::mutex> lk(mu_);
    json_doc::add_int(rec.root, "seq", (int64_t)++seq_);
    out_ << json_doc::to_canonical(rec.root) << "\n";
    out_.flush();
}

} // namespace modpack
