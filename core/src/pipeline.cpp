#include "modpack/pipeline.h"
#include "modpack/json_doc.h"

#include <chrono>
#include <iostream>
#include <system_error>

namespace modpack {

namespace {

constexpr const char* kInternalMessage = "Internal server error";

int64_t steady_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

} // namespace

const char* stage_name(Stage s) {
    switch (s) {
        case Stage::VALIDATING:   return "validating";
        case Stage::PROVISIONING: return "provisioning";
        case Stage::INSTALLING:   return "installing";
        case Stage::ARCHIVING:    return "archiving";
        case Stage::REGISTERING:  return "registering";
        case Stage::DONE:         return "done";
        case Stage::FAILED:       return "failed";
    }
    return "failed";
}

std::string download_link(const std::string& origin, const std::string& id) {
    std::string base = origin;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/download/" + id;
}

BuildPipeline::BuildPipeline(WorkspaceProvisioner& provisioner,
                             BuildExecutor& executor,
                             Archiver& archiver,
                             ArtifactRegistry& registry,
                             EventLog& events,
                             PipelineOptions opt)
    : provisioner_(provisioner),
      executor_(executor),
      archiver_(archiver),
      registry_(registry),
      events_(events),
      opt_(opt) {}

BuildOutcome BuildPipeline::fail(Stage at, FailureKind kind, std::string message, std::string diagnostics) {
    BuildOutcome o;
    o.stage = Stage::FAILED;
    o.failed_at = at;
    o.kind = kind;
    o.message = std::move(message);
    o.diagnostics = std::move(diagnostics);
    return o;
}

void BuildPipeline::log_failure(const BuildOutcome& o, int exit_code) {
    json_object* p = json_object_new_object();
    json_doc::add_string(p, "stage", stage_name(o.failed_at));
    json_doc::add_string(p, "kind", failure_kind_name(o.kind));
    if (exit_code >= 0) json_doc::add_int(p, "exit_code", exit_code);
    events_.event(o.kind == FailureKind::INTERNAL ? "build.internal_error" : "build.fail", p);
}

BuildOutcome BuildPipeline::run_build(const ManifestInput& in, std::unique_ptr<WorkspaceGuard>& guard) {
    Stage stage = Stage::VALIDATING;
    int exit_code = -1;
    try {
        ManifestCheck mc = check_manifest(in, opt_.size_limit);
        if (mc.kind != FailureKind::NONE) {
            BuildOutcome o = fail(stage, mc.kind, mc.message);
            log_failure(o, -1);
            return o;
        }

        stage = Stage::PROVISIONING;
        guard = std::make_unique<WorkspaceGuard>(provisioner_.create());
        const Workspace& ws = guard->get();
        provisioner_.write_manifest(ws, mc.content);

        stage = Stage::INSTALLING;
        ToolOutcome inst = executor_.install(ws);
        if (!inst.ok) {
            exit_code = inst.exit_code;
            guard.reset();
            BuildOutcome o = fail(stage, FailureKind::BUILD_TOOL, "install failed", std::move(inst.diagnostics));
            log_failure(o, exit_code);
            return o;
        }

        stage = Stage::ARCHIVING;
        ToolOutcome arc = archiver_.compress(ws);
        if (!arc.ok) {
            exit_code = arc.exit_code;
            guard.reset();
            BuildOutcome o = fail(stage, FailureKind::ARCHIVE_TOOL, "Archive failed", std::move(arc.diagnostics));
            log_failure(o, exit_code);
            return o;
        }

        BuildOutcome o;
        o.stage = Stage::REGISTERING;
        return o;
    } catch (const ProvisionError& e) {
        std::cerr << "[pipeline] provision failed: " << e.what() << "\n";
    } catch (const WriteError& e) {
        std::cerr << "[pipeline] manifest write failed: " << e.what() << "\n";
    } catch (const std::exception& e) {
        guard.reset();
        std::cerr << "[pipeline] unexpected failure at " << stage_name(stage) << ": " << e.what() << "\n";
        BuildOutcome o = fail(stage, FailureKind::INTERNAL, kInternalMessage);
        log_failure(o, -1);
        return o;
    }
    guard.reset();
    BuildOutcome o = fail(stage, FailureKind::PROVISION, kInternalMessage);
    log_failure(o, -1);
    return o;
}

BuildOutcome BuildPipeline::submit(const ManifestInput& in, const std::string& origin) {
    const int64_t t0 = steady_ms();
    std::unique_ptr<WorkspaceGuard> guard;
    BuildOutcome o = run_build(in, guard);
    if (o.stage != Stage::REGISTERING) return o;

    try {
        const Workspace ws = guard->get();
        std::error_code ec;
        uint64_t bytes = std::filesystem::file_size(ws.archive_path(), ec);
        if (ec) throw std::runtime_error("archive vanished before registration: " + ec.message());

        o.expires_at_ms = registry_.now_ms() + opt_.ttl_ms;
        o.id = registry_.put(ws.archive_path(), ws.dir, o.expires_at_ms, bytes);
        guard->release(); // the registry owns the workspace now

        o.stage = Stage::DONE;
        o.archive_bytes = bytes;
        o.link = download_link(origin, o.id);
        o.message = "ok";
    } catch (const std::exception& e) {
        guard.reset();
        std::cerr << "[pipeline] registration failed: " << e.what() << "\n";
        o = fail(Stage::REGISTERING, FailureKind::INTERNAL, kInternalMessage);
        log_failure(o, -1);
        return o;
    }

    json_object* p = json_object_new_object();
    json_doc::add_string(p, "id_prefix", o.id.substr(0, 8));
    json_doc::add_int(p, "bytes", (int64_t)o.archive_bytes);
    json_doc::add_int(p, "expires_at_ms", o.expires_at_ms);
    json_doc::add_int(p, "duration_ms", steady_ms() - t0);
    events_.event("build.ok", p);
    return o;
}

BuildOutcome BuildPipeline::build_to_file(const ManifestInput& in, const std::filesystem::path& out_file) {
    std::unique_ptr<WorkspaceGuard> guard;
    BuildOutcome o = run_build(in, guard);
    if (o.stage != Stage::REGISTERING) return o;

    std::error_code ec;
    std::filesystem::copy_file(guard->get().archive_path(), out_file,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        guard.reset();
        return fail(Stage::REGISTERING, FailureKind::INTERNAL,
                    "cannot write " + out_file.string() + ": " + ec.message());
    }
    o.archive_bytes = std::filesystem::file_size(out_file, ec);
    guard.reset();
    o.stage = Stage::DONE;
    o.message = "ok";
    return o;
}

} // namespace modpack
