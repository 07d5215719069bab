#pragma once

// Shared entrypoint for the headless StopGrid CLI.
//
// Kept separate from main() so tests and other front-ends can drive the same
// code path with a synthetic argv.
//
// Implementation: src/cli/CliMain.cpp

namespace stopgrid {

// Exit codes: 0 ok, 1 runtime failure (I/O, bad input file), 2 usage error.
int StopGridCliMain(int argc, char** argv);

} // namespace stopgrid
