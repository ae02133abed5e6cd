#include "test_common.h"
#include "fake_runner.h"

#include "modpack/crypto.h"
#include "modpack/pipeline.h"

#include <atomic>
#include <fstream>
#include <set>
#include <thread>

using namespace modpack;
using modpack_test::ScriptedRunner;
using modpack_test::exited;

namespace {

struct Rig {
    std::filesystem::path root;
    std::atomic<int64_t> now{5000000};
    ScriptedRunner runner;
    WorkspaceProvisioner prov;
    BuildExecutor exec;
    Archiver arch;
    ArtifactRegistry reg;
    EventLog events;
    BuildPipeline pipe;

    explicit Rig(const std::filesystem::path& r, int64_t ttl_ms = 60000, size_t limit = 4096)
        : root(r),
          prov(r),
          exec(runner, {"install-tool", "install"}, ProcLimits{}),
          arch(runner, {"archive-tool", "-czf"}, ProcLimits{}),
          reg(16, [this] { return now.load(); }),
          events((r.parent_path() / (r.filename().string() + "-events.jsonl")).string()),
          pipe(prov, exec, arch, reg, events, PipelineOptions{ttl_ms, limit}) {}
};

ManifestInput text(const std::string& s) {
    ManifestInput in;
    in.pasted_text = s;
    return in;
}

std::string slurp(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

} // namespace

int main() {
    auto tmp = make_temp_dir("pipeline");
    const std::string manifest = "{\"name\":\"demo\",\"dependencies\":{\"left-pad\":\"1.3.0\"}}";

    // success: link, expiry, registered archive, workspace owned by the registry
    {
        Rig rig(tmp / "ok");
        BuildOutcome o = rig.pipe.submit(text(manifest), "http://example.test:3000/");
        expect_true(o.ok(), "build succeeded: " + o.message);
        expect_true(o.stage == Stage::DONE, "stage done");
        expect_true(is_token_hex(o.id, 32), "id is a token");
        expect_eq_str(o.link, "http://example.test:3000/download/" + o.id, "download link");
        expect_eq_ll(o.expires_at_ms, 5000000 + 60000, "expiry = now + ttl");

        auto e = rig.reg.get(o.id);
        expect_true(e.has_value(), "registered");
        expect_true(std::filesystem::is_regular_file(e->path), "archive on disk");
        expect_eq_ll((long long)e->size_bytes, (long long)std::filesystem::file_size(e->path), "size recorded");
        expect_eq_ll((long long)o.archive_bytes, (long long)e->size_bytes, "size reported");
        expect_true(slurp(e->path).find(manifest) != std::string::npos, "archive built from this manifest");
        expect_eq_ll((long long)count_entries(rig.root), 1, "one workspace kept");

        // a second build of the same manifest is a distinct artifact
        BuildOutcome o2 = rig.pipe.submit(text(manifest), "http://example.test:3000");
        expect_true(o2.ok() && o2.id != o.id, "distinct ids");
        expect_true(rig.reg.get(o2.id)->workspace != e->workspace, "distinct workspaces");

        std::string log = slurp(tmp / "ok-events.jsonl");
        expect_true(log.find("\"event\":\"build.ok\"") != std::string::npos, "build.ok logged");
        expect_true(log.find(o.id) == std::string::npos, "full id not logged");
    }

    // input errors: no workspace, no tool invocation
    {
        Rig rig(tmp / "input", 60000, 64);
        BuildOutcome a = rig.pipe.submit(ManifestInput{}, "http://h");
        expect_true(a.kind == FailureKind::MISSING_INPUT && a.stage == Stage::FAILED && a.failed_at == Stage::VALIDATING, "missing input");
        BuildOutcome b = rig.pipe.submit(text("{\"oops\":"), "http://h");
        expect_true(b.kind == FailureKind::MALFORMED_INPUT, "malformed input");
        expect_eq_str(b.message, "Invalid JSON.", "malformed message");
        BuildOutcome c = rig.pipe.submit(text("{\"k\":\"" + std::string(100, 'z') + "\"}"), "http://h");
        expect_true(c.kind == FailureKind::TOO_LARGE, "too large");

        // lenient-parser extensions are not JSON and never reach the installer
        const char* not_json[] = {
            "{'name':'x',}",
            "{\"a\":1 /*c*/}",
            "{\"a\":1,}",
            "{\"a\":NaN}",
        };
        for (const char* nj : not_json) {
            BuildOutcome d = rig.pipe.submit(text(nj), "http://h");
            expect_true(d.kind == FailureKind::MALFORMED_INPUT, std::string("rejected: ") + nj);
            expect_true(d.failed_at == Stage::VALIDATING, "rejected while validating");
        }

        expect_eq_ll((long long)rig.runner.call_count(), 0, "tools never ran");
        expect_eq_ll((long long)count_entries(rig.root), 0, "no workspace");
        expect_eq_ll((long long)rig.reg.size(), 0, "nothing registered");
    }

    // installer failure: diagnostics returned, workspace removed, archiver skipped
    {
        Rig rig(tmp / "instfail");
        rig.runner.install = [](const std::vector<std::string>&, const std::string& cwd) {
            std::filesystem::create_directories(std::filesystem::path(cwd) / "node_modules" / "half");
            return exited(1, "error: GET https://registry.npmjs.org/nope - 404\n");
        };
        BuildOutcome o = rig.pipe.submit(text("{\"dependencies\":{\"nope\":\"1\"}}"), "http://h");
        expect_true(o.kind == FailureKind::BUILD_TOOL && o.stage == Stage::FAILED && o.failed_at == Stage::INSTALLING, "install failure");
        expect_true(o.diagnostics.find("404") != std::string::npos, "installer output surfaced");
        expect_eq_ll((long long)rig.runner.call_count(), 1, "archiver not invoked");
        expect_eq_ll((long long)count_entries(rig.root), 0, "workspace removed");
        expect_eq_ll((long long)rig.reg.size(), 0, "nothing registered");
    }

    // archive failure
    {
        Rig rig(tmp / "arcfail");
        rig.runner.archive = [](const std::vector<std::string>&, const std::string&) { return exited(2, "tar: disk full\n"); };
        BuildOutcome o = rig.pipe.submit(text(manifest), "http://h");
        expect_true(o.kind == FailureKind::ARCHIVE_TOOL && o.stage == Stage::FAILED && o.failed_at == Stage::ARCHIVING, "archive failure");
        expect_eq_str(o.message, "Archive failed", "archive message");
        expect_eq_ll((long long)count_entries(rig.root), 0, "workspace removed");
        expect_eq_ll((long long)rig.reg.size(), 0, "nothing registered");
    }

    // unexpected exception inside a tool is an internal error, not a crash
    {
        Rig rig(tmp / "boom");
        rig.runner.install = [](const std::vector<std::string>&, const std::string&) -> ProcResult {
            throw std::runtime_error("runner exploded");
        };
        BuildOutcome o = rig.pipe.submit(text(manifest), "http://h");
        expect_true(o.kind == FailureKind::INTERNAL, "internal failure");
        expect_eq_str(o.message, "Internal server error", "generic message");
        expect_true(o.message.find("exploded") == std::string::npos, "details not leaked");
        expect_eq_ll((long long)count_entries(rig.root), 0, "workspace removed");
    }

    // provisioning failure
    {
        std::ofstream(tmp / "notadir") << "x";
        Rig rig(tmp / "notadir" / "root");
        BuildOutcome o = rig.pipe.submit(text(manifest), "http://h");
        expect_true(o.kind == FailureKind::PROVISION && o.stage == Stage::FAILED && o.failed_at == Stage::PROVISIONING, "provision failure");
        expect_eq_ll((long long)rig.runner.call_count(), 0, "tools never ran");
    }

    // expiry end to end: after ttl and a sweep, nothing is left anywhere
    {
        Rig rig(tmp / "expiry", 1000);
        std::vector<std::string> ids;
        for (int i = 0; i < 5; i++) {
            BuildOutcome o = rig.pipe.submit(text(manifest), "http://h");
            expect_true(o.ok(), "build ok");
            ids.push_back(o.id);
        }
        expect_eq_ll((long long)count_entries(rig.root), 5, "five workspaces");
        rig.now += 1000;
        SweepStats st = rig.reg.sweep(rig.now);
        expect_eq_ll((long long)st.expired, 5, "all expired");
        expect_eq_ll((long long)rig.reg.size(), 0, "registry empty");
        expect_eq_ll((long long)count_entries(rig.root), 0, "no orphaned workspace");
        for (auto& id : ids) {
            expect_true(rig.reg.take_if_live(id).status == LookupStatus::NOT_FOUND, "expired id is gone");
        }
    }

    // concurrent submits are independent
    {
        Rig rig(tmp / "concurrent");
        const int kN = 8;
        std::vector<BuildOutcome> outs(kN);
        std::vector<std::thread> ths;
        for (int i = 0; i < kN; i++) {
            ths.emplace_back([&, i] {
                outs[i] = rig.pipe.submit(text("{\"name\":\"p" + std::to_string(i) + "\"}"), "http://h");
            });
        }
        for (auto& t : ths) t.join();
        std::set<std::string> ids;
        for (int i = 0; i < kN; i++) {
            expect_true(outs[i].ok(), "concurrent build ok");
            ids.insert(outs[i].id);
            auto e = rig.reg.get(outs[i].id);
            expect_true(slurp(e->path).find("\"p" + std::to_string(i) + "\"") != std::string::npos,
                        "each archive built from its own manifest");
        }
        expect_eq_ll((long long)ids.size(), kN, "ids distinct");
    }

    // build_to_file leaves no workspace and no registry entry
    {
        Rig rig(tmp / "tofile");
        auto out = tmp / "out.tar.gz";
        BuildOutcome o = rig.pipe.build_to_file(text(manifest), out);
        expect_true(o.ok(), "build_to_file ok");
        expect_true(std::filesystem::is_regular_file(out), "output written");
        expect_eq_ll((long long)o.archive_bytes, (long long)std::filesystem::file_size(out), "output size");
        expect_eq_ll((long long)count_entries(rig.root), 0, "workspace removed");
        expect_eq_ll((long long)rig.reg.size(), 0, "registry untouched");
    }

    expect_eq_str(download_link("https://x.test//", "abc"), "https://x.test/download/abc", "link trims slashes");
    expect_eq_str(stage_name(Stage::ARCHIVING), "archiving", "stage name");

    std::filesystem::remove_all(tmp);
    std::cout << "test_pipeline: ALL PASSED\n";
    return 0;
}
