#include "cpu_tool.hpp"

#include "console.hpp"
#include "control.hpp"
#include "cpu.hpp"
#include "installer.hpp"
#include "modes.hpp"

namespace amdopt {

void print_cpu_usage(std::ostream& os) {
    os <<
R"(AMD CPU Optimizer v)" AMDOPT_VERSION R"(
Usage: amd_cpu_optimize [options] [command]

Commands:
  performance     Set CPU to performance mode
  powersave       Set CPU to power save mode
  boost-on        Enable CPU boost
  boost-off       Disable CPU boost
  status          Show current CPU status (default)
  install         Install required dependencies
  help            Show this help message

Options:
  --dry-run       Print the sysfs writes instead of performing them
  --no-color      Plain output (also honored: NO_COLOR)
  --sudo <cmd>    Escalation helper when not root (default: sudo)
  --root <dir>    Prefix for /sys and /proc paths

Examples:
  amd_cpu_optimize performance  # Set CPU to maximum performance
  amd_cpu_optimize status       # Show current CPU information
  amd_cpu_optimize boost-on     # Enable CPU frequency boost
)";
}

static void apply_cpu_mode(CpuMode mode, const CpuHost& host, Context& ctx) {
    ControlWriter writer(ctx.writer, ctx.console);
    const auto cores = host.cores();

    for (const auto& step : expand(mode)) {
        ctx.console.info("Setting CPU " + attribute_label(step.attribute) + " to " +
                         describe_value(step) + "...");
        if (step.attribute == Attribute::Boost) {
            writer.apply("cpu", host.boost_path(), step);
            continue;
        }
        if (cores.empty()) {
            ctx.console.warning("No cpufreq-enabled cores found");
            continue;
        }
        for (const auto& core : cores) {
            writer.apply(core.name, host.control_path(core, step.attribute), step);
        }
    }
    ctx.console.line();
}

int run_cpu_tool(const Options& opts, Context& ctx) {
    Console& con = ctx.console;
    con.banner("AMD CPU Optimizer", AMDOPT_VERSION);

    if (is_help_verb(opts.verb)) {
        print_cpu_usage(con.out());
        return 0;
    }

    const auto mode = cpu_mode_from_verb(opts.verb);
    if (!mode && opts.verb != "status" && opts.verb != "install") {
        con.fatal("Unknown option: " + opts.verb);
        con.err() << "\n";
        print_cpu_usage(con.err());
        return 1;
    }

    CpuHost host(ctx.root);
    if (!host.is_amd()) {
        con.fatal("This tool is designed for AMD processors only!");
        con.fatal("Detected: " + host.vendor_id().value_or("unknown"));
        return 1;
    }

    if (opts.verb == "install") {
        install_packages(kCpuPackages, ctx);
    } else {
        if (mode) apply_cpu_mode(*mode, host, ctx);
        print_cpu_status(host.read_status(), con);
    }

    con.line();
    con.info("Completed.");
    return 0;
}

}  // namespace amdopt
