#pragma once

// modpack_cli build <package.json> --out <file.tar.gz>
int cmd_build(int argc, char** argv);
