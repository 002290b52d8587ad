#include "installer.hpp"

#include "cli.hpp"
#include "console.hpp"
#include "shell.hpp"

namespace amdopt {

const PackagePlan kCpuPackages = {
    "cpupower",
    "cpupower",
    "linux-cpupower",
    "kernel-tools",
};

const PackagePlan kGpuPackages = {
    "GPU tools",
    "mesa vulkan-radeon lib32-mesa lib32-vulkan-radeon radeontop",
    "mesa-utils vulkan-tools radeontop",
    "mesa-dri-drivers vulkan-tools radeontop",
};

void install_packages(const PackagePlan& plan, Context& ctx) {
    ctx.console.info("Installing " + plan.what + "...");
    const std::string p = ctx.is_root ? "" : ctx.sudo + " ";

    std::string cmd;
    if (ctx.shell.has_command("pacman")) {
        cmd = p + "pacman -S --noconfirm " + plan.pacman;
    } else if (ctx.shell.has_command("apt")) {
        cmd = p + "apt update && " + p + "apt install -y " + plan.apt;
    } else if (ctx.shell.has_command("dnf")) {
        cmd = p + "dnf install -y " + plan.dnf;
    } else {
        ctx.console.warning("Package manager not recognized. Please install " + plan.what + " manually.");
        return;
    }

    int rc = ctx.shell.run(cmd);
    if (rc != 0) {
        ctx.console.error("Install command failed (status " + std::to_string(rc) + "): " + cmd);
        return;
    }
    ctx.console.status(plan.what + " installed");
}

}  // namespace amdopt
