#include "cmd_build.h"
#include "service.h"

#include <fstream>
#include <iostream>
#include <sstream>

using namespace modpack;

int cmd_build(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: modpack_cli build <package.json> --out <file.tar.gz>\n";
        return 2;
    }
    std::string manifest_path = argv[2];
    std::string out = "node_modules.tar.gz";
    for (int i = 3; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--out" && i + 1 < argc) { out = argv[++i]; continue; }
        std::cerr << "unknown option: " << a << "\n";
        return 2;
    }

    std::ifstream f(manifest_path, std::ios::binary);
    if (!f) {
        std::cerr << "cannot read " << manifest_path << "\n";
        return 2;
    }
    std::ostringstream ss;
    ss << f.rdbuf();

    apply_profile_defaults(detect_profile());
    ServiceConfig cfg = load_config_from_env();

    std::unique_ptr<Service> svc;
    try {
        svc = std::make_unique<Service>(cfg);
    } catch (const std::exception& e) {
        std::cerr << "configuration error: " << e.what() << "\n";
        return 2;
    }

    ManifestInput in;
    in.has_file = true;
    in.file_content = ss.str();

    BuildOutcome o = svc->pipeline.build_to_file(in, out);
    if (o.ok()) {
        std::cout << out << " (" << o.archive_bytes << " bytes)\n";
        return 0;
    }
    std::cerr << o.message << " [" << failure_kind_name(o.kind) << " at " << stage_name(o.failed_at) << "]\n";
    if (!o.diagnostics.empty()) std::cerr << o.diagnostics << "\n";
    if (is_input_error(o.kind)) return 3;
    return 1;
}
