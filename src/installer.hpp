#pragma once

#include <string>

namespace amdopt {

struct Context;

// Packages per manager; managers are probed pacman, apt, dnf.
struct PackagePlan {
    std::string what;  // "cpupower", "GPU tools"
    std::string pacman;
    std::string apt;
    std::string dnf;
};

extern const PackagePlan kCpuPackages;
extern const PackagePlan kGpuPackages;

// Failures are reported on the console; they never change the exit code.
void install_packages(const PackagePlan& plan, Context& ctx);

}  // namespace amdopt
