#include "cmd_build.h"
#include "cmd_serve.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "modpack_cli <serve|build> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "serve") return cmd_serve(argc, argv);
    if (cmd == "build") return cmd_build(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
