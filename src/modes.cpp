#include "modes.hpp"

#include <cctype>

namespace amdopt {

std::vector<Step> expand(CpuMode mode) {
    switch (mode) {
        case CpuMode::Performance: return {{Attribute::Governor, "performance"}};
        case CpuMode::Powersave:   return {{Attribute::Governor, "powersave"}};
        case CpuMode::BoostOn:     return {{Attribute::Boost, "1"}};
        case CpuMode::BoostOff:    return {{Attribute::Boost, "0"}};
    }
    return {};
}

std::vector<Step> expand(GpuMode mode) {
    switch (mode) {
        case GpuMode::High:   return {{Attribute::PerformanceLevel, "high"}};
        case GpuMode::Low:    return {{Attribute::PerformanceLevel, "low"}};
        case GpuMode::Auto:   return {{Attribute::PerformanceLevel, "auto"}};
        case GpuMode::Manual: return {{Attribute::PerformanceLevel, "manual"}};
        case GpuMode::Reset:  return {{Attribute::PerformanceLevel, "auto"}};
        case GpuMode::Gaming:
            return {{Attribute::PerformanceLevel, "high"},
                    {Attribute::PowerProfile, std::to_string(kProfile3dFullScreen)}};
        case GpuMode::Compute:
            return {{Attribute::PerformanceLevel, "high"},
                    {Attribute::PowerProfile, std::to_string(kProfileCompute)}};
        case GpuMode::PowerSave:
            return {{Attribute::PerformanceLevel, "low"},
                    {Attribute::PowerProfile, std::to_string(kProfilePowerSaving)}};
    }
    return {};
}

std::optional<CpuMode> cpu_mode_from_verb(const std::string& verb) {
    if (verb == "performance") return CpuMode::Performance;
    if (verb == "powersave")   return CpuMode::Powersave;
    if (verb == "boost-on")    return CpuMode::BoostOn;
    if (verb == "boost-off")   return CpuMode::BoostOff;
    return std::nullopt;
}

std::optional<GpuMode> gpu_mode_from_verb(const std::string& verb) {
    if (verb == "high")       return GpuMode::High;
    if (verb == "low")        return GpuMode::Low;
    if (verb == "auto")       return GpuMode::Auto;
    if (verb == "manual")     return GpuMode::Manual;
    if (verb == "gaming")     return GpuMode::Gaming;
    if (verb == "compute")    return GpuMode::Compute;
    if (verb == "power-save") return GpuMode::PowerSave;
    if (verb == "reset")      return GpuMode::Reset;
    return std::nullopt;
}

std::string attribute_label(Attribute a) {
    switch (a) {
        case Attribute::Governor:         return "governor";
        case Attribute::Boost:            return "boost";
        case Attribute::PerformanceLevel: return "performance level";
        case Attribute::PowerProfile:     return "power profile";
    }
    return "control";
}

std::optional<int> parse_profile_index(const std::string& arg) {
    if (arg.empty() || arg.size() > 2) return std::nullopt;
    for (char c : arg) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    int n = std::stoi(arg);
    if (n < kMinProfile || n > kMaxProfile) return std::nullopt;
    return n;
}

std::string profile_name(int index) {
    switch (index) {
        case 0: return "Custom";
        case 1: return "3D Full Screen";
        case 2: return "Power Saving";
        case 3: return "Video";
        case 4: return "VR";
        case 5: return "Compute";
        case 6: return "Custom";
        default: return "Unknown";
    }
}

std::string describe_value(const Step& step) {
    switch (step.attribute) {
        case Attribute::Boost:
            return step.value == "1" ? "enabled" : "disabled";
        case Attribute::PowerProfile: {
            auto idx = parse_profile_index(step.value);
            if (idx) return step.value + " (" + profile_name(*idx) + ")";
            return step.value;
        }
        default:
            return step.value;
    }
}

}  // namespace amdopt
