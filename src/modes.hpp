#pragma once

#include <optional>
#include <string>
#include <vector>

namespace amdopt {

enum class Attribute {
    Governor,          // cpuN/cpufreq/scaling_governor
    Boost,             // cpu/cpufreq/boost (global)
    PerformanceLevel,  // cardN/device/power_dpm_force_performance_level
    PowerProfile,      // cardN/device/pp_power_profile_mode
};

struct Step {
    Attribute attribute;
    std::string value;
};

enum class CpuMode { Performance, Powersave, BoostOn, BoostOff };

enum class GpuMode { High, Low, Auto, Manual, Gaming, Compute, PowerSave, Reset };

constexpr int kMinProfile = 0;
constexpr int kMaxProfile = 6;
constexpr int kProfile3dFullScreen = 1;
constexpr int kProfilePowerSaving = 2;
constexpr int kProfileCompute = 5;

// Ordered writes a mode expands to. Applied to every device of the kind.
std::vector<Step> expand(CpuMode mode);
std::vector<Step> expand(GpuMode mode);

std::optional<CpuMode> cpu_mode_from_verb(const std::string& verb);
std::optional<GpuMode> gpu_mode_from_verb(const std::string& verb);

std::string attribute_label(Attribute a);

// Strict decimal in [kMinProfile, kMaxProfile].
std::optional<int> parse_profile_index(const std::string& arg);

std::string profile_name(int index);

// "performance", "1 (3D Full Screen)", "enabled".
std::string describe_value(const Step& step);

}  // namespace amdopt
