#pragma once

// Time-boxed, id-keyed index of finished archives.
//
// - ids are 128-bit random tokens (32 lowercase hex chars)
// - the map is split into shards, each with its own mutex; operations on
//   different ids rarely contend and no lock is ever held across file I/O
// - removal is authoritative: once an entry leaves the map (expiry seen by a
//   lookup, sweep, or drain) no lookup can return it again
// - storage of removed entries is reclaimed outside the shard locks. Entries
//   found expired by take_if_live are queued and reclaimed by the next sweep;
//   storage a sweep fails to delete is queued again and retried.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace modpack {

struct ArtifactEntry {
    std::string id;
    std::filesystem::path path;      // the archive
    std::filesystem::path workspace; // directory owning the archive, removed with it
    int64_t expires_at_ms{0};        // epoch ms; dead at or after this instant
    uint64_t size_bytes{0};
};

enum class LookupStatus { LIVE, NOT_FOUND, EXPIRED };

const char* lookup_status_name(LookupStatus s);

struct Lookup {
    LookupStatus status{LookupStatus::NOT_FOUND};
    ArtifactEntry entry; // valid only when LIVE
};

struct SweepStats {
    size_t expired{0};   // entries removed from the map by this sweep
    size_t reclaimed{0}; // storage directories deleted (includes queued ones)
    size_t failed{0};    // deletions that reported an error (requeued)
};

int64_t wall_clock_ms();

class ArtifactRegistry {
public:
    using Clock = std::function<int64_t()>;

    explicit ArtifactRegistry(size_t shard_count = 16, Clock clock = wall_clock_ms);
    ~ArtifactRegistry() = default;
    ArtifactRegistry(const ArtifactRegistry&) = delete;
    ArtifactRegistry& operator=(const ArtifactRegistry&) = delete;

    // Registers an archive under a fresh id and returns the id. The registry
    // owns the storage from here on.
    std::string put(const std::filesystem::path& archive,
                    const std::filesystem::path& workspace,
                    int64_t expires_at_ms,
                    uint64_t size_bytes);

    // Plain lookup, no expiry check, no mutation.
    std::optional<ArtifactEntry> get(const std::string& id) const;

    // Lookup against the clock. An expired entry is removed (and queued for
    // reclamation) and reported as EXPIRED; an unknown id is NOT_FOUND.
    Lookup take_if_live(const std::string& id);

    // Remove every entry with expires_at_ms <= now and delete its storage,
    // plus anything queued by take_if_live.
    SweepStats sweep(int64_t now_ms);

    // Remove everything (shutdown). Returns entries removed.
    size_t drain();

    size_t size() const;
    int64_t now_ms() const { return clock_(); }

private:
    struct Shard {
        mutable std::mutex mu;
        std::unordered_map<std::string, ArtifactEntry> map;
    };

    Shard& shard_for(const std::string& id) const;
    void queue_reclaim(ArtifactEntry e);
    static bool reclaim(const ArtifactEntry& e);

    std::vector<std::unique_ptr<Shard>> shards_;
    std::mutex reclaim_mu_;
    std::vector<ArtifactEntry> reclaim_;
    Clock clock_;
};

// Background thread calling registry.sweep() every interval until stop().
class Sweeper {
public:
    using Callback = std::function<void(const SweepStats&)>;

    Sweeper(ArtifactRegistry& registry, int64_t interval_ms, Callback on_sweep = nullptr);
    ~Sweeper();
    Sweeper(const Sweeper&) = delete;
    Sweeper& operator=(const Sweeper&) = delete;

    void start();
    void stop();
    uint64_t ticks() const { return ticks_.load(); }

private:
    void loop();

    ArtifactRegistry& registry_;
    int64_t interval_ms_;
    Callback on_sweep_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_{false};
    std::atomic<uint64_t> ticks_{0};
    std::thread thread_;
};

} // namespace modpack
