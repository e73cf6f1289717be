#pragma once
/*
================================================================================
Fragment 7.0 — CLI: Command Dispatch (fusion_cli)
FILE: cpp/cli/cli_app.hpp
================================================================================
*/

namespace fusion::cli {

// Parses argv, runs one command and returns the process exit code:
// 0 ok / feasible / converged, 1 argument, I/O or configuration error,
// 2 infeasible point or solver not converged.
int run(int argc, char** argv);

}  // namespace fusion::cli
