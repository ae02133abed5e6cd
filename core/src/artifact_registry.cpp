#include "modpack/artifact_registry.h"
#include "modpack/crypto.h"
#include "modpack/workspace.h"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace modpack {

int64_t wall_clock_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

const char* lookup_status_name(LookupStatus s) {
    switch (s) {
        case LookupStatus::LIVE:      return "live";
        case LookupStatus::NOT_FOUND: return "not_found";
        case LookupStatus::EXPIRED:   return "expired";
    }
    return "not_found";
}

ArtifactRegistry::ArtifactRegistry(size_t shard_count, Clock clock) : clock_(std::move(clock)) {
    if (shard_count == 0) shard_count = 1;
    if (!clock_) clock_ = wall_clock_ms;
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; i++) shards_.push_back(std::make_unique<Shard>());
}

ArtifactRegistry::Shard& ArtifactRegistry::shard_for(const std::string& id) const {
    return *shards_[std::hash<std::string>{}(id) % shards_.size()];
}

std::string ArtifactRegistry::put(const std::filesystem::path& archive,
                                  const std::filesystem::path& workspace,
                                  int64_t expires_at_ms,
                                  uint64_t size_bytes) {
    // A 128-bit collision is not expected; retry anyway rather than overwrite.
    for (int attempt = 0; attempt < 8; attempt++) {
        ArtifactEntry e;
        e.id = random_token_hex(16);
        e.path = archive;
        e.workspace = workspace;
        e.expires_at_ms = expires_at_ms;
        e.size_bytes = size_bytes;

        Shard& sh = shard_for(e.id);
        std::lock_guard<std::mutex> lk(sh.mu);
        std::string id = e.id;
        if (sh.map.try_emplace(id, std::move(e)).second) return id;
    }
    throw std::runtime_error("ArtifactRegistry::put: could not allocate a unique id");
}

std::optional<ArtifactEntry> ArtifactRegistry::get(const std::string& id) const {
    Shard& sh = shard_for(id);
    std::lock_guard<std::mutex> lk(sh.mu);
    auto it = sh.map.find(id);
    if (it == sh.map.end()) return std::nullopt;
    return it->second;
}

Lookup ArtifactRegistry::take_if_live(const std::string& id) {
    const int64_t now = clock_();
    Lookup r;
    ArtifactEntry dead;
    {
        Shard& sh = shard_for(id);
        std::lock_guard<std::mutex> lk(sh.mu);
        auto it = sh.map.find(id);
        if (it == sh.map.end()) {
            r.status = LookupStatus::NOT_FOUND;
            return r;
        }
        if (it->second.expires_at_ms > now) {
            r.status = LookupStatus::LIVE;
            r.entry = it->second;
            return r;
        }
        dead = std::move(it->second);
        sh.map.erase(it);
    }
    r.status = LookupStatus::EXPIRED;
    queue_reclaim(std::move(dead));
    return r;
}

void ArtifactRegistry::queue_reclaim(ArtifactEntry e) {
    std::lock_guard<std::mutex> lk(reclaim_mu_);
    reclaim_.push_back(std::move(e));
}

bool ArtifactRegistry::reclaim(const ArtifactEntry& e) {
    if (!e.workspace.empty()) return WorkspaceProvisioner::destroy(e.workspace);
    std::error_code ec;
    std::filesystem::remove(e.path, ec);
    return !ec;
}

SweepStats ArtifactRegistry::sweep(int64_t now_ms) {
    SweepStats st;
    std::vector<ArtifactEntry> victims;

    // Snapshot: each shard is locked only long enough to unlink its expired entries.
    for (auto& shp : shards_) {
        std::lock_guard<std::mutex> lk(shp->mu);
        for (auto it = shp->map.begin(); it != shp->map.end(); ) {
            if (it->second.expires_at_ms <= now_ms) {
                victims.push_back(std::move(it->second));
                it = shp->map.erase(it);
            } else {
                ++it;
            }
        }
    }
    st.expired = victims.size();
    {
        std::lock_guard<std::mutex> lk(reclaim_mu_);
        for (auto& e : reclaim_) victims.push_back(std::move(e));
        reclaim_.clear();
    }

    std::vector<ArtifactEntry> retry;
    for (auto& e : victims) {
        if (reclaim(e)) {
            st.reclaimed++;
        } else {
            st.failed++;
            retry.push_back(std::move(e));
        }
    }
    if (!retry.empty()) {
        std::lock_guard<std::mutex> lk(reclaim_mu_);
        for (auto& e : retry) reclaim_.push_back(std::move(e));
    }
    return st;
}

size_t ArtifactRegistry::drain() {
    std::vector<ArtifactEntry> victims;
    for (auto& shp : shards_) {
        std::lock_guard<std::mutex> lk(shp->mu);
        for (auto& kv : shp->map) victims.push_back(std::move(kv.second));
        shp->map.clear();
    }
    const size_t n = victims.size();
    {
        std::lock_guard<std::mutex> lk(reclaim_mu_);
        for (auto& e : reclaim_) victims.push_back(std::move(e));
        reclaim_.clear();
    }
    for (const auto& e : victims) (void)reclaim(e);
    return n;
}

size_t ArtifactRegistry::size() const {
    size_t n = 0;
    for (const auto& shp : shards_) {
        std::lock_guard<std::mutex> lk(shp->mu);
        n += shp->map.size();
    }
    return n;
}

// --- Sweeper ---

Sweeper::Sweeper(ArtifactRegistry& registry, int64_t interval_ms, Callback on_sweep)
    : registry_(registry), interval_ms_(interval_ms < 1 ? 1 : interval_ms), on_sweep_(std::move(on_sweep)) {}

Sweeper::~Sweeper() { stop(); }

void Sweeper::start() {
    std::lock_guard<std::mutex> lk(mu_);
    if (thread_.joinable()) return;
    stop_ = false;
    thread_ = std::thread([this]() { loop(); });
}

void Sweeper::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void Sweeper::loop() {
    std::unique_lock<std::mutex> lk(mu_);
    while (!stop_) {
        if (cv_.wait_for(lk, std::chrono::milliseconds(interval_ms_), [this] { return stop_; })) break;
        lk.unlock();
        SweepStats st = registry_.sweep(registry_.now_ms());
        ticks_.fetch_add(1);
        if (on_sweep_) {
            try {
                on_sweep_(st);
            } catch (const std::exception& e) {
                std::cerr << "[sweep] callback failed: " << e.what() << "\n";
            }
        }
        lk.lock();
    }
}

} // namespace modpack
