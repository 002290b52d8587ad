// amd_gpu_optimize.cpp
// Sets amdgpu performance level / power profile through sysfs and prints status.
//
//   amd_gpu_optimize gaming
//   amd_gpu_optimize profile 5
//   amd_gpu_optimize --dry-run compute

#include <iostream>

#include <unistd.h>

#include "cli.hpp"
#include "console.hpp"
#include "gpu_tool.hpp"
#include "privileged_writer.hpp"
#include "shell.hpp"

int main(int argc, char** argv) {
    amdopt::Options opts = amdopt::parse_options(argc, argv);
    amdopt::Console console(std::cout, std::cerr,
                            amdopt::color_enabled(opts.no_color, STDOUT_FILENO),
                            amdopt::color_enabled(opts.no_color, STDERR_FILENO));
    amdopt::SystemShell shell;

    // Probed once; every write goes through the writer chosen here.
    const bool is_root = ::geteuid() == 0;
    auto writer = amdopt::make_privileged_writer(opts.dry_run, is_root, shell, opts.sudo, std::cout);

    amdopt::Context ctx{opts.root, console, shell, *writer, is_root, opts.sudo};
    return amdopt::run_gpu_tool(opts, ctx);
}
