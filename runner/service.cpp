#include "service.h"
#include "pages.h"
#include "serve_http.h"

#include "modpack/json_doc.h"

#include <cctype>
#include <iostream>
#include <stdexcept>

namespace modpack {

std::vector<std::string> tool_argv(const std::string& cmd, const char* what) {
    auto av = split_argv_quoted(cmd);
    if (av.empty()) throw std::invalid_argument(std::string(what) + " command is empty or malformed: '" + cmd + "'");
    return av;
}

static ProcLimits tool_limits(int timeout_ms, size_t diag_max) {
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    lim.output_max_bytes = diag_max;
    return lim;
}

Service::Service(const ServiceConfig& config, std::unique_ptr<ICommandRunner> tool_runner)
    : cfg(config),
      events(config.event_log_path),
      provisioner(config.work_root),
      runner(std::move(tool_runner)),
      executor(*runner, tool_argv(config.install_cmd, "install"),
               tool_limits(config.install_timeout_ms, config.diag_max_bytes)),
      archiver(*runner, tool_argv(config.archive_cmd, "archive"),
               tool_limits(config.archive_timeout_ms, config.diag_max_bytes)),
      registry(16),
      pipeline(provisioner, executor, archiver, registry, events,
               PipelineOptions{config.ttl_ms, config.size_limit}),
      downloads(registry, events) {}

std::string request_origin(const ServiceConfig& cfg, const std::string& head) {
    if (!cfg.public_origin.empty()) return cfg.public_origin;
    std::string host = header_value_ci(head, "host");
    bool host_ok = !host.empty();
    for (char c : host) {
        bool ok = std::isalnum((unsigned char)c) || c == '.' || c == '-' || c == ':' || c == '[' || c == ']';
        if (!ok) { host_ok = false; break; }
    }
    if (host_ok) return "http://" + host;
    return "http://" + cfg.host + ":" + std::to_string(cfg.port);
}

bool ConnectionGate::try_enter() {
    std::lock_guard<std::mutex> lk(mu_);
    if (active_ >= max_) return false;
    active_++;
    return true;
}

void ConnectionGate::leave() {
    std::lock_guard<std::mutex> lk(mu_);
    active_--;
    cv_.notify_all();
}

void ConnectionGate::wait_idle() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return active_ == 0; });
}

int ConnectionGate::active() const {
    std::lock_guard<std::mutex> lk(mu_);
    return active_;
}

static int status_for(FailureKind k) {
    switch (k) {
        case FailureKind::NONE:            return 200;
        case FailureKind::MISSING_INPUT:   return 400;
        case FailureKind::MALFORMED_INPUT: return 400;
        case FailureKind::TOO_LARGE:       return 413;
        case FailureKind::BUILD_TOOL:      return 500;
        case FailureKind::ARCHIVE_TOOL:    return 500;
        case FailureKind::PROVISION:       return 500;
        case FailureKind::INTERNAL:        return 500;
    }
    return 500;
}

static void handle_upload(Service& svc, int cfd, const std::string& head, const std::string& body) {
    ManifestInput in;
    if (!extract_manifest_input(head, body, in)) {
        send_text(cfd, 400, "Malformed form data.");
        return;
    }

    BuildOutcome o = svc.pipeline.submit(in, request_origin(svc.cfg, head));
    if (o.ok()) {
        send_html(cfd, 200, render_success_page(o.link, svc.cfg.ttl_ms));
        return;
    }

    std::string text = o.message;
    if (o.kind == FailureKind::BUILD_TOOL) {
        text = render_failure_text(svc.cfg.install_cmd.substr(0, svc.cfg.install_cmd.find(' ')) + " install failed",
                                   o.diagnostics);
    } else if (o.kind == FailureKind::ARCHIVE_TOOL) {
        text = render_failure_text("Archive failed", o.diagnostics);
    }
    send_text(cfd, status_for(o.kind), text);
}

static void handle_download(Service& svc, int cfd, const std::string& id) {
    DownloadResult r = svc.downloads.open(id);
    if (!r.error.empty()) {
        std::cerr << "[serve] download failed: " << r.error << "\n";
        send_text(cfd, 500, "Internal server error");
        return;
    }
    switch (r.status) {
        case LookupStatus::NOT_FOUND:
            send_text(cfd, 404, "Not found");
            return;
        case LookupStatus::EXPIRED:
            send_text(cfd, 410, "Expired");
            return;
        case LookupStatus::LIVE:
            break;
    }
    if (!send_artifact(cfd, r.file)) {
        // client disconnect mid-stream; registry state is untouched
        std::cerr << "[serve] download of " << id.substr(0, 8) << "... ended early\n";
    }
}

void handle_http_connection(Service& svc, int cfd) {
    std::string head, body;
    ReadStatus rs = read_http_request(cfd, head, body, svc.cfg.max_body_bytes());
    if (rs == ReadStatus::TOO_LARGE) {
        send_text(cfd, 413, "Request too large (" + std::to_string(svc.cfg.size_limit) + " byte limit).");
        return;
    }
    if (rs != ReadStatus::OK) return;

    RequestLine rl = parse_request_line(head);
    static const std::string kDownloadPrefix = "/download/";

    if (rl.method == "GET" && rl.path == "/") {
        send_html(cfd, 200, render_form_page());
        return;
    }
    if (rl.method == "GET" && rl.path == "/health") {
        json_doc::Doc j(json_object_new_object());
        json_doc::add_bool(j.root, "ok", true);
        json_doc::add_int(j.root, "artifacts", (int64_t)svc.registry.size());
        send_json(cfd, 200, json_object_to_json_string_ext(j.root, JSON_C_TO_STRING_PLAIN));
        return;
    }
    if (rl.method == "POST" && rl.path == "/upload") {
        handle_upload(svc, cfd, head, body);
        return;
    }
    if (rl.method == "GET" && rl.path.rfind(kDownloadPrefix, 0) == 0) {
        handle_download(svc, cfd, rl.path.substr(kDownloadPrefix.size()));
        return;
    }
    send_text(cfd, 404, "Not Found");
}

} // namespace modpack
