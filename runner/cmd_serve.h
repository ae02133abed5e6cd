#pragma once

// modpack_cli serve [--host H] [--port N] [--ttl_ms N] [--sweep_ms N] [--work_root DIR]
int cmd_serve(int argc, char** argv);
