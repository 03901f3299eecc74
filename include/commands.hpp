#pragma once
#include "cli.hpp"
#include <ostream>

// Runs one parsed command. Results go to `out`, progress and errors to `err`.
// Returns 0 on success, 2 on a runtime failure.
int run_command(const Args& args, std::ostream& out, std::ostream& err);
