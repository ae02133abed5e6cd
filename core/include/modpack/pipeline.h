#pragma once

#include "artifact_registry.h"
#include "builder.h"
#include "errors.h"
#include "log.h"
#include "manifest.h"
#include "workspace.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace modpack {

// Per-request state machine:
//   VALIDATING -> PROVISIONING -> INSTALLING -> ARCHIVING -> REGISTERING -> DONE
// with FAILED reachable from every non-terminal stage.
enum class Stage { VALIDATING, PROVISIONING, INSTALLING, ARCHIVING, REGISTERING, DONE, FAILED };

const char* stage_name(Stage s);

struct BuildOutcome {
    Stage stage{Stage::VALIDATING};        // DONE or FAILED once the request is over
    Stage failed_at{Stage::VALIDATING};    // last stage entered, when stage == FAILED
    FailureKind kind{FailureKind::NONE};
    std::string id;
    std::string link;                      // <origin>/download/<id>
    int64_t expires_at_ms{0};
    uint64_t archive_bytes{0};
    std::string message;                   // client-facing summary
    std::string diagnostics;               // tool output for BUILD_TOOL / ARCHIVE_TOOL

    bool ok() const { return kind == FailureKind::NONE && stage == Stage::DONE; }
};

struct PipelineOptions {
    int64_t ttl_ms{60LL * 60 * 1000};
    size_t size_limit{1000000};
};

std::string download_link(const std::string& origin, const std::string& id);

class BuildPipeline {
public:
    BuildPipeline(WorkspaceProvisioner& provisioner,
                  BuildExecutor& executor,
                  Archiver& archiver,
                  ArtifactRegistry& registry,
                  EventLog& events,
                  PipelineOptions opt);

    // Full request: validate, build, register. Never throws; every failure is
    // reported in the outcome and its workspace is gone when this returns.
    BuildOutcome submit(const ManifestInput& in, const std::string& origin);

    // Same stages without the registry: the archive is copied to out_file and
    // the workspace destroyed. Used by `modpack_cli build`.
    BuildOutcome build_to_file(const ManifestInput& in, const std::filesystem::path& out_file);

private:
    // Runs VALIDATING..ARCHIVING. On success `guard` holds the finished
    // workspace (still armed); on failure the outcome says why.
    BuildOutcome run_build(const ManifestInput& in, std::unique_ptr<WorkspaceGuard>& guard);
    BuildOutcome fail(Stage at, FailureKind kind, std::string message, std::string diagnostics = "");
    void log_failure(const BuildOutcome& o, int exit_code);

    WorkspaceProvisioner& provisioner_;
    BuildExecutor& executor_;
    Archiver& archiver_;
    ArtifactRegistry& registry_;
    EventLog& events_;
    PipelineOptions opt_;
};

} // namespace modpack
