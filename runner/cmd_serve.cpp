#include "cmd_serve.h"
#include "serve_http.h"
#include "service.h"

#include "modpack/json_doc.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#ifndef _WIN32

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace modpack;

namespace {

volatile std::sig_atomic_t g_stop = 0;

void on_stop_signal(int) { g_stop = 1; }

int open_listener(const std::string& host, int port) {
    int sfd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (sfd < 0) { std::cerr << "socket failed\n"; return -1; }
    int one = 1;
    ::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "bad host: " << host << "\n";
        ::close(sfd);
        return -1;
    }
    if (::bind(sfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "bind " << host << ":" << port << " failed\n";
        ::close(sfd);
        return -1;
    }
    if (::listen(sfd, 64) < 0) {
        std::cerr << "listen failed\n";
        ::close(sfd);
        return -1;
    }
    return sfd;
}

} // namespace

int cmd_serve(int argc, char** argv) {
    // Ignore SIGPIPE: a client disconnecting mid-download must not kill the server
    ::signal(SIGPIPE, SIG_IGN);

    apply_profile_defaults(detect_profile());
    ServiceConfig cfg = load_config_from_env();

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--host" && i + 1 < argc) { cfg.host = argv[++i]; continue; }
        if (a == "--port" && i + 1 < argc) { cfg.port = std::atoi(argv[++i]); continue; }
        if (a == "--ttl_ms" && i + 1 < argc) { cfg.ttl_ms = std::max<int64_t>(1000, std::atoll(argv[++i])); continue; }
        if (a == "--sweep_ms" && i + 1 < argc) { cfg.sweep_interval_ms = std::max<int64_t>(1000, std::atoll(argv[++i])); continue; }
        if (a == "--work_root" && i + 1 < argc) { cfg.work_root = argv[++i]; continue; }
        std::cerr << "unknown option: " << a << "\n";
        return 2;
    }
    if (cfg.port <= 0 || cfg.port > 65535) {
        std::cerr << "bad port\n";
        return 2;
    }

    std::unique_ptr<Service> svc;
    try {
        svc = std::make_unique<Service>(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[serve] configuration error: " << e.what() << "\n";
        return 2;
    }

    // Registry is memory-only: anything left on disk is from a dead process.
    size_t purged = svc->provisioner.purge_orphans();
    if (purged > 0) {
        std::cerr << "[serve] purged " << purged << " orphaned workspace(s) under " << cfg.work_root << "\n";
        json_object* p = json_object_new_object();
        json_doc::add_int(p, "count", (int64_t)purged);
        svc->events.event("startup.purged", p);
    }

    // Bind before starting the sweeper so a failed bind leaves no thread behind.
    int sfd = open_listener(cfg.host, cfg.port);
    if (sfd < 0) return 2;

    EventLog& events = svc->events;
    Sweeper sweeper(svc->registry, cfg.sweep_interval_ms, [&events](const SweepStats& st) {
        if (st.expired == 0 && st.reclaimed == 0 && st.failed == 0) return;
        std::cerr << "[sweep] expired=" << st.expired << " reclaimed=" << st.reclaimed
                  << " failed=" << st.failed << "\n";
        json_object* p = json_object_new_object();
        json_doc::add_int(p, "expired", (int64_t)st.expired);
        json_doc::add_int(p, "reclaimed", (int64_t)st.reclaimed);
        json_doc::add_int(p, "failed", (int64_t)st.failed);
        events.event("sweep.evicted", p);
    });
    sweeper.start();

    struct sigaction sa{};
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);

    std::cerr << "[serve] http://" << cfg.host << ":" << cfg.port
              << " profile=" << profile_name(detect_profile())
              << " ttl_ms=" << cfg.ttl_ms << " sweep_ms=" << cfg.sweep_interval_ms
              << " work_root=" << cfg.work_root << "\n";

    ConnectionGate gate(cfg.max_conns);

    while (!g_stop) {
        struct pollfd pfd;
        pfd.fd = sfd;
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, 500) <= 0) continue;

        int cfd = ::accept4(sfd, nullptr, nullptr, SOCK_CLOEXEC);
        if (cfd < 0) continue;
        if (!gate.try_enter()) {
            send_text(cfd, 503, "Too many connections");
            ::close(cfd);
            continue;
        }
        set_socket_timeouts(cfd, 30);

        // Builds run for as long as the tools take; each connection owns a thread.
        Service& service = *svc;
        std::thread([&service, &gate, cfd]() {
            try {
                handle_http_connection(service, cfd);
            } catch (const std::exception& e) {
                std::cerr << "[serve] request failed: " << e.what() << "\n";
            }
            ::close(cfd);
            gate.leave();
        }).detach();
    }

    std::cerr << "[serve] shutting down, waiting for " << gate.active() << " request(s)\n";
    ::close(sfd);
    gate.wait_idle();
    sweeper.stop();
    size_t drained = svc->registry.drain();
    std::cerr << "[serve] drained " << drained << " artifact(s)\n";
    return 0;
}

#else
int cmd_serve(int, char**) {
    std::cerr << "serve not supported on Windows build\n";
    return 2;
}
#endif
