#pragma once

#include <optional>
#include <string>
#include <vector>

#include "modes.hpp"

namespace amdopt {

class Console;

constexpr const char* kAmdCpuVendor = "AuthenticAMD";

// One logical core with a cpufreq directory.
struct CpuCore {
    int index;
    std::string name;  // "cpu3"
    std::string path;  // <root>/sys/devices/system/cpu/cpu3
};

struct CoreFrequency {
    std::string name;
    long long mhz;
};

struct CpuStatus {
    std::string model = "Unknown";
    std::string cores = "Unknown";
    int threads = 0;
    std::string governor = "Unknown";
    std::string available_governors;
    std::optional<bool> boost;  // nullopt: not available
    std::vector<CoreFrequency> frequencies;
};

class CpuHost {
public:
    explicit CpuHost(std::string root);

    // vendor_id of the first processor in cpuinfo.
    std::optional<std::string> vendor_id() const;
    bool is_amd() const;

    // Every cpuN with a cpufreq directory, in index order.
    std::vector<CpuCore> cores() const;

    std::string governor_path(const CpuCore& core) const;
    std::string boost_path() const;

    // Path for attribute on core; boost ignores core.
    std::string control_path(const CpuCore& core, Attribute a) const;

    CpuStatus read_status() const;

private:
    std::optional<std::string> cpuinfo_field(const std::string& key) const;

    std::string root_;
    std::string cpu_dir_;
    std::string cpuinfo_;
};

void print_cpu_status(const CpuStatus& status, Console& console);

}  // namespace amdopt
