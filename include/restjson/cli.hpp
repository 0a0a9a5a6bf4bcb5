#pragma once

namespace restjson::cli
{
    /** Parse arguments and run the selected subcommand; returns the process exit code. */
    int run(int argc, char *argv[]);
}
