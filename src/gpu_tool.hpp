#pragma once

#include <ostream>

#include "cli.hpp"

namespace amdopt {

// amd_gpu_optimize: dispatches one verb, returns the process exit code.
int run_gpu_tool(const Options& opts, Context& ctx);

void print_gpu_usage(std::ostream& os);

// Checks the kernel command line and creates /etc/modprobe.d/amdgpu.conf if missing.
void enable_overclocking(Context& ctx);

}  // namespace amdopt
