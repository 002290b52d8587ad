#pragma once

#include <ostream>

#include "cli.hpp"

namespace amdopt {

// amd_cpu_optimize: dispatches one verb, returns the process exit code.
int run_cpu_tool(const Options& opts, Context& ctx);

void print_cpu_usage(std::ostream& os);

}  // namespace amdopt
