#pragma once

#include "modpack/artifact_registry.h"
#include "modpack/builder.h"
#include "modpack/config.h"
#include "modpack/download.h"
#include "modpack/log.h"
#include "modpack/pipeline.h"
#include "modpack/proc.h"
#include "modpack/workspace.h"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace modpack {

// Everything one process needs, wired from a ServiceConfig. Member order is
// construction order.
struct Service {
    explicit Service(const ServiceConfig& config,
                     std::unique_ptr<ICommandRunner> tool_runner = std::make_unique<SubprocessRunner>());

    ServiceConfig cfg;
    EventLog events;
    WorkspaceProvisioner provisioner;
    std::unique_ptr<ICommandRunner> runner;
    BuildExecutor executor;
    Archiver archiver;
    ArtifactRegistry registry;
    BuildPipeline pipeline;
    DownloadService downloads;
};

// Tool argv from a configured command line. Throws std::invalid_argument on
// an empty or unbalanced-quote command.
std::vector<std::string> tool_argv(const std::string& cmd, const char* what);

// Origin used for download links: the configured public origin, else
// http://<Host header>, else http://<host>:<port>.
std::string request_origin(const ServiceConfig& cfg, const std::string& head);

// In-flight connection counter with a cap. leave() notifies while holding the
// lock, so once wait_idle() returns no leave() is still using the gate.
class ConnectionGate {
public:
    explicit ConnectionGate(int max_active) : max_(max_active) {}
    ConnectionGate(const ConnectionGate&) = delete;
    ConnectionGate& operator=(const ConnectionGate&) = delete;

    bool try_enter();
    void leave();
    void wait_idle();
    int active() const;

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    int active_{0};
    int max_;
};

// Serve exactly one request on cfd (already accepted). Does not close cfd.
void handle_http_connection(Service& svc, int cfd);

} // namespace modpack
