#include "test_common.h"

#include "modpack/artifact_registry.h"
#include "modpack/crypto.h"

#include <atomic>
#include <fstream>
#include <set>
#include <thread>
#include <vector>

using namespace modpack;

namespace {

struct FakeClock {
    std::atomic<int64_t> now{1000000};
    ArtifactRegistry::Clock fn() {
        return [this] { return now.load(); };
    }
};

// A workspace-shaped directory holding one archive file.
std::filesystem::path make_artifact(const std::filesystem::path& root, int n) {
    auto dir = root / ("mp-" + std::to_string(n));
    std::filesystem::create_directories(dir / "node_modules");
    std::ofstream(dir / "node_modules.tar.gz", std::ios::binary) << "archive-" << n;
    return dir;
}

} // namespace

int main() {
    auto tmp = make_temp_dir("registry");

    // ids
    {
        std::string t = random_token_hex(16);
        expect_eq_ll((long long)t.size(), 32, "token length");
        expect_true(is_token_hex(t, 32), "token is lowercase hex");
        expect_true(!is_token_hex("ABCDEF0123456789abcdef0123456789", 32), "uppercase rejected");
        expect_true(!is_token_hex("abc", 32), "short rejected");
        expect_true(!is_token_hex("../../../../etc/passwd0000000000", 32), "path rejected");
    }

    // put/get/take_if_live, boundary at expires_at_ms
    {
        FakeClock clk;
        ArtifactRegistry reg(4, clk.fn());
        auto dir = make_artifact(tmp, 1);
        std::string id = reg.put(dir / "node_modules.tar.gz", dir, clk.now + 500, 9);
        expect_true(is_token_hex(id, 32), "put returns hex id");
        expect_eq_ll((long long)reg.size(), 1, "one entry");

        auto g = reg.get(id);
        expect_true(g.has_value() && g->size_bytes == 9, "get finds entry");

        Lookup l = reg.take_if_live(id);
        expect_true(l.status == LookupStatus::LIVE, "live before expiry");
        expect_true(l.entry.path == dir / "node_modules.tar.gz", "entry path");

        clk.now += 499;
        expect_true(reg.take_if_live(id).status == LookupStatus::LIVE, "live one ms before expiry");
        clk.now += 1;
        expect_true(reg.take_if_live(id).status == LookupStatus::EXPIRED, "dead exactly at expiry");
        expect_true(reg.take_if_live(id).status == LookupStatus::NOT_FOUND, "removal is permanent");
        expect_true(!reg.get(id).has_value(), "get after removal");
        expect_eq_ll((long long)reg.size(), 0, "registry empty");

        // storage of a lookup-evicted entry goes with the next sweep
        expect_true(std::filesystem::exists(dir), "not reclaimed under the lookup");
        SweepStats st = reg.sweep(clk.now);
        expect_eq_ll((long long)st.expired, 0, "nothing left in the map");
        expect_eq_ll((long long)st.reclaimed, 1, "queued entry reclaimed");
        expect_true(!std::filesystem::exists(dir), "workspace deleted");

        expect_true(reg.take_if_live(random_token_hex(16)).status == LookupStatus::NOT_FOUND, "unknown id");
    }

    // sweep removes exactly the expired entries
    {
        FakeClock clk;
        ArtifactRegistry reg(16, clk.fn());
        std::vector<std::string> short_ids, long_ids;
        std::vector<std::filesystem::path> short_dirs, long_dirs;
        for (int i = 0; i < 10; i++) {
            auto d = make_artifact(tmp, 100 + i);
            short_dirs.push_back(d);
            short_ids.push_back(reg.put(d / "node_modules.tar.gz", d, clk.now + 100, 1));
        }
        for (int i = 0; i < 5; i++) {
            auto d = make_artifact(tmp, 200 + i);
            long_dirs.push_back(d);
            long_ids.push_back(reg.put(d / "node_modules.tar.gz", d, clk.now + 10000, 1));
        }
        expect_eq_ll((long long)reg.size(), 15, "15 entries");

        SweepStats early = reg.sweep(clk.now + 99);
        expect_eq_ll((long long)early.expired, 0, "nothing expired yet");

        SweepStats st = reg.sweep(clk.now + 100);
        expect_eq_ll((long long)st.expired, 10, "short-lived entries expired");
        expect_eq_ll((long long)st.reclaimed, 10, "short-lived storage reclaimed");
        expect_eq_ll((long long)st.failed, 0, "no failures");
        expect_eq_ll((long long)reg.size(), 5, "long-lived remain");
        for (auto& d : short_dirs) expect_true(!std::filesystem::exists(d), "expired storage gone");
        for (auto& d : long_dirs) expect_true(std::filesystem::exists(d), "live storage kept");
        for (auto& id : long_ids) expect_true(reg.get(id).has_value(), "live ids kept");
        for (auto& id : short_ids) expect_true(!reg.get(id).has_value(), "expired ids gone");

        // already-deleted storage still counts as reclaimed
        std::filesystem::remove_all(long_dirs[0]);
        SweepStats st2 = reg.sweep(clk.now + 10000);
        expect_eq_ll((long long)st2.expired, 5, "rest expired");
        expect_eq_ll((long long)st2.failed, 0, "missing storage is not a failure");
        expect_eq_ll((long long)reg.size(), 0, "empty after full sweep");
    }

    // storage that cannot be deleted stays queued and is retried by every sweep
    {
        FakeClock clk;
        ArtifactRegistry reg(4, clk.fn());
        // a component longer than NAME_MAX makes every removal fail with ENAMETOOLONG
        auto stuck = tmp / std::string(300, 'n');
        reg.put(stuck / "node_modules.tar.gz", stuck, clk.now + 1, 1);
        clk.now += 1;

        SweepStats first = reg.sweep(clk.now);
        expect_eq_ll((long long)first.expired, 1, "stuck entry expired");
        expect_eq_ll((long long)first.failed, 1, "deletion failed");
        expect_eq_ll((long long)first.reclaimed, 0, "nothing reclaimed");

        SweepStats second = reg.sweep(clk.now);
        expect_eq_ll((long long)second.expired, 0, "no new expiry");
        expect_eq_ll((long long)second.failed, 1, "failed deletion retried");
        expect_eq_ll((long long)reg.size(), 0, "entry stays unreachable");
        reg.drain();
        expect_eq_ll((long long)reg.sweep(clk.now).failed, 0, "drain drops the retry queue");
    }

    // drain
    {
        ArtifactRegistry reg(2);
        auto d = make_artifact(tmp, 300);
        reg.put(d / "node_modules.tar.gz", d, wall_clock_ms() + 60000, 1);
        expect_eq_ll((long long)reg.drain(), 1, "drained one");
        expect_true(!std::filesystem::exists(d), "drain deletes storage");
        expect_eq_ll((long long)reg.size(), 0, "empty after drain");
    }

    // concurrent put/lookup/sweep: every id is unique, live ones stay visible
    {
        FakeClock clk;
        ArtifactRegistry reg(16, clk.fn());
        const int kThreads = 8, kPer = 200;
        std::vector<std::vector<std::string>> ids(kThreads);
        std::atomic<bool> bad{false};
        std::atomic<bool> done{false};

        std::thread sweeper([&] {
            while (!done.load()) reg.sweep(clk.now.load());
        });
        std::vector<std::thread> ths;
        for (int t = 0; t < kThreads; t++) {
            ths.emplace_back([&, t] {
                for (int i = 0; i < kPer; i++) {
                    std::string id = reg.put(tmp / "none.tgz", std::filesystem::path(), clk.now + 1000000, 1);
                    ids[t].push_back(id);
                    if (reg.take_if_live(id).status != LookupStatus::LIVE) bad = true;
                }
            });
        }
        for (auto& th : ths) th.join();
        done = true;
        sweeper.join();

        expect_true(!bad.load(), "fresh entries always live under contention");
        std::set<std::string> all;
        for (auto& v : ids) all.insert(v.begin(), v.end());
        expect_eq_ll((long long)all.size(), kThreads * kPer, "ids unique");
        expect_eq_ll((long long)reg.size(), kThreads * kPer, "no entry lost");

        clk.now += 1000000;
        SweepStats st = reg.sweep(clk.now);
        expect_eq_ll((long long)st.expired, kThreads * kPer, "all expire together");
    }

    // background sweeper
    {
        FakeClock clk;
        ArtifactRegistry reg(4, clk.fn());
        auto d = make_artifact(tmp, 400);
        reg.put(d / "node_modules.tar.gz", d, clk.now + 10, 1);
        clk.now += 10;

        std::atomic<size_t> seen_expired{0};
        Sweeper sw(reg, 20, [&](const SweepStats& st) { seen_expired += st.expired; });
        sw.start();
        for (int i = 0; i < 200 && sw.ticks() < 2; i++) std::this_thread::sleep_for(std::chrono::milliseconds(10));
        sw.stop();
        expect_true(sw.ticks() >= 1, "sweeper ticked");
        expect_eq_ll((long long)seen_expired.load(), 1, "sweeper evicted the entry");
        expect_eq_ll((long long)reg.size(), 0, "registry empty");
        expect_true(!std::filesystem::exists(d), "sweeper reclaimed storage");
        sw.stop(); // idempotent
    }

    std::filesystem::remove_all(tmp);
    std::cout << "test_registry: ALL PASSED\n";
    return 0;
}
