#pragma once

namespace apimgr::cli
{
    /** Entry point for the apimgr-cli executable; returns the process exit code. */
    int run(int argc, char *argv[]);
}
