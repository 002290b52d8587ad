// amd_cpu_optimize.cpp
// Sets the cpufreq governor / boost of an AMD CPU through sysfs and prints status.
//
//   amd_cpu_optimize performance
//   amd_cpu_optimize boost-off
//   amd_cpu_optimize --dry-run powersave

#include <iostream>

#include <unistd.h>

#include "cli.hpp"
#include "console.hpp"
#include "cpu_tool.hpp"
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
    return amdopt::run_cpu_tool(opts, ctx);
}
