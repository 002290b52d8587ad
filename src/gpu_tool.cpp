#include "gpu_tool.hpp"

#include <optional>
#include <vector>

#include "console.hpp"
#include "control.hpp"
#include "gpu.hpp"
#include "installer.hpp"
#include "modes.hpp"
#include "privileged_writer.hpp"
#include "sysfs_io.hpp"

namespace amdopt {

static const char* kPpFeatureMaskParam = "amdgpu.ppfeaturemask";
static const char* kModprobeLine = "options amdgpu ppfeaturemask=0xffffffff";

void print_gpu_usage(std::ostream& os) {
    os <<
R"(AMD GPU Optimizer v)" AMDOPT_VERSION R"(
Usage: amd_gpu_optimize [options] [command]

Commands:
  high            Set GPU to high performance mode
  low             Set GPU to low/power-saving mode
  auto            Set GPU to automatic mode
  manual          Set GPU to manual control mode
  gaming          Set optimal settings for gaming (high + 3D profile)
  compute         Set optimal settings for compute tasks
  power-save      Set power-saving mode
  profile <0-6>   Set power profile (0=Custom, 1=3D, 2=PowerSave, 3=Video, 4=VR, 5=Compute)
  clocks          Show available clock speeds and states
  status          Show current GPU status (default)
  reset           Reset GPU to default/auto mode
  install         Install required GPU tools
  enable-oc       Enable GPU overclocking support
  help            Show this help message

Options:
  --dry-run       Print the sysfs writes instead of performing them
  --no-color      Plain output (also honored: NO_COLOR)
  --sudo <cmd>    Escalation helper when not root (default: sudo)
  --root <dir>    Prefix for /sys, /proc and /etc paths

Examples:
  amd_gpu_optimize gaming       # Set optimal gaming performance
  amd_gpu_optimize status       # Show current GPU information
  amd_gpu_optimize profile 1    # Set 3D Full Screen profile
  amd_gpu_optimize high         # Set high performance mode
)";
}

static void report_status(const std::vector<GpuCard>& cards, Context& ctx) {
    std::vector<GpuStatus> statuses;
    for (const auto& card : cards) statuses.push_back(read_gpu_status(card, ctx.shell));
    print_gpu_status(statuses, ctx.console);
}

static void apply_steps(const std::string& what, const std::vector<Step>& steps,
                        const std::vector<GpuCard>& cards, Context& ctx) {
    ctx.console.info("Setting GPU " + what);
    ControlWriter writer(ctx.writer, ctx.console);
    for (const auto& card : cards) {
        writer.apply_all(card.name, steps,
                         [&card](Attribute a) { return control_path(card, a); });
    }
    ctx.console.line();
}

static std::string describe_steps(const std::vector<Step>& steps) {
    std::string s;
    for (const auto& step : steps) {
        if (!s.empty()) s += ", ";
        s += attribute_label(step.attribute) + " " + describe_value(step);
    }
    return s;
}

void enable_overclocking(Context& ctx) {
    Console& con = ctx.console;
    con.info("Enabling GPU overclocking features...");

    auto cmdline = read_text(host_path(ctx.root, "/proc/cmdline"));
    if (cmdline && cmdline->find(kPpFeatureMaskParam) != std::string::npos) {
        con.status("GPU overclocking already enabled in kernel parameters");
    } else {
        con.warning("GPU overclocking not enabled in kernel parameters");
        con.info(std::string("To enable, add '") + kPpFeatureMaskParam + "=0xffffffff' to kernel parameters");
        con.info("For GRUB: Edit /etc/default/grub and add to GRUB_CMDLINE_LINUX_DEFAULT");
        con.info("Then run: sudo grub-mkconfig -o /boot/grub/grub.cfg");
    }

    const std::string modprobe = host_path(ctx.root, "/etc/modprobe.d/amdgpu.conf");
    if (exists(modprobe)) {
        con.status("amdgpu modprobe configuration already exists");
        return;
    }
    WriteResult r = ctx.writer.write(modprobe, kModprobeLine);
    if (r.ok) con.status("Created amdgpu modprobe configuration");
    else      con.error("Failed to create " + modprobe + (r.error.empty() ? "" : " (" + r.error + ")"));
}

int run_gpu_tool(const Options& opts, Context& ctx) {
    Console& con = ctx.console;
    con.banner("AMD GPU Optimizer", AMDOPT_VERSION);

    const std::string& verb = opts.verb;
    if (is_help_verb(verb)) {
        print_gpu_usage(con.out());
        return 0;
    }

    const auto mode = gpu_mode_from_verb(verb);
    const bool known = mode || verb == "profile" || verb == "clocks" || verb == "status" ||
                       verb == "install" || verb == "enable-oc";
    if (!known) {
        con.fatal("Unknown option: " + verb);
        con.err() << "\n";
        print_gpu_usage(con.err());
        return 1;
    }

    std::optional<int> profile;
    if (verb == "profile") {
        if (opts.args.empty()) {
            con.fatal("Profile number required (0-6)");
            print_gpu_usage(con.err());
            return 1;
        }
        profile = parse_profile_index(opts.args.front());
    }

    const auto cards = find_amd_cards(ctx.root);
    if (cards.empty()) {
        con.fatal("This tool is designed for AMD GPUs only!");
        con.fatal("No AMD graphics cards detected.");
        return 1;
    }

    if (mode) {
        const auto steps = expand(*mode);
        apply_steps(describe_steps(steps), steps, cards, ctx);
        if (*mode == GpuMode::Manual) {
            con.info("GPU set to manual mode. Use 'clocks' command to see available settings.");
        } else if (*mode == GpuMode::Reset) {
            con.info("GPU reset to automatic mode");
        }
        report_status(cards, ctx);
    } else if (verb == "profile") {
        // An out-of-range profile writes nothing but is not fatal; status is still shown.
        if (profile) {
            const std::vector<Step> steps = {{Attribute::PowerProfile, std::to_string(*profile)}};
            apply_steps(describe_steps(steps), steps, cards, ctx);
        } else {
            con.error("Invalid profile: " + opts.args.front() + " (expected 0-6)");
            con.line();
        }
        report_status(cards, ctx);
    } else if (verb == "clocks") {
        for (const auto& card : cards) print_gpu_clocks(card, con);
    } else if (verb == "status") {
        report_status(cards, ctx);
    } else if (verb == "install") {
        install_packages(kGpuPackages, ctx);
    } else if (verb == "enable-oc") {
        enable_overclocking(ctx);
    }

    con.line();
    con.info("Completed.");
    return 0;
}

}  // namespace amdopt
