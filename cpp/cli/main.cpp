/*
================================================================================
Fragment 7.0 — CLI: Main Entry Point (fusion_cli)
FILE: cpp/cli/main.cpp

Usage:
  fusion_cli <command> [options]      (see fusion_cli help)
================================================================================
*/

#include "cli/cli_app.hpp"

int main(int argc, char** argv) {
  return fusion::cli::run(argc, argv);
}
