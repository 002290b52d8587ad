#include "cpu.hpp"

#include <stdexcept>
#include <utility>

#include "console.hpp"
#include "sysfs_io.hpp"

namespace amdopt {

CpuHost::CpuHost(std::string root)
    : root_(std::move(root)),
      cpu_dir_(host_path(root_, "/sys/devices/system/cpu")),
      cpuinfo_(host_path(root_, "/proc/cpuinfo")) {}

std::optional<std::string> CpuHost::cpuinfo_field(const std::string& key) const {
    auto lines = read_lines(cpuinfo_);
    if (!lines) return std::nullopt;
    for (const auto& line : *lines) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        if (trim(line.substr(0, colon)) == key) return trim(line.substr(colon + 1));
    }
    return std::nullopt;
}

std::optional<std::string> CpuHost::vendor_id() const { return cpuinfo_field("vendor_id"); }

bool CpuHost::is_amd() const {
    auto v = vendor_id();
    return v && v->find(kAmdCpuVendor) != std::string::npos;
}

std::vector<CpuCore> CpuHost::cores() const {
    std::vector<CpuCore> out;
    for (auto& d : numbered_dirs(cpu_dir_, "cpu")) {
        if (!exists(d.path + "/cpufreq")) continue;
        out.push_back({d.index, d.name, d.path});
    }
    return out;
}

std::string CpuHost::governor_path(const CpuCore& core) const {
    return core.path + "/cpufreq/scaling_governor";
}

std::string CpuHost::boost_path() const { return cpu_dir_ + "/cpufreq/boost"; }

std::string CpuHost::control_path(const CpuCore& core, Attribute a) const {
    switch (a) {
        case Attribute::Governor: return governor_path(core);
        case Attribute::Boost:    return boost_path();
        default:                  return "";
    }
}

CpuStatus CpuHost::read_status() const {
    CpuStatus st;
    st.model = cpuinfo_field("model name").value_or("Unknown");
    st.cores = cpuinfo_field("cpu cores").value_or("Unknown");

    const auto cs = cores();
    if (auto lines = read_lines(cpuinfo_)) {
        for (const auto& line : *lines) {
            size_t colon = line.find(':');
            if (colon != std::string::npos && trim(line.substr(0, colon)) == "processor") ++st.threads;
        }
    }
    if (st.threads == 0) st.threads = static_cast<int>(cs.size());

    const std::string cpu0 = cpu_dir_ + "/cpu0/cpufreq";
    st.governor = read_text(cpu0 + "/scaling_governor").value_or("Unknown");
    st.available_governors = read_text(cpu0 + "/scaling_available_governors").value_or("");

    if (auto b = read_text(boost_path())) st.boost = (*b == "1");

    for (const auto& c : cs) {
        auto khz = read_text(c.path + "/cpufreq/scaling_cur_freq");
        if (!khz) continue;
        try {
            st.frequencies.push_back({c.name, std::stoll(*khz) / 1000});
        } catch (const std::exception&) {
            continue;
        }
    }
    return st;
}

void print_cpu_status(const CpuStatus& st, Console& console) {
    console.info("Current CPU Status:");
    console.line("====================");
    console.line("CPU Model: " + st.model);
    console.line("CPU Cores: " + st.cores);
    console.line("CPU Threads: " + std::to_string(st.threads));
    console.line("Current Governor: " + st.governor);
    console.line();
    console.line("Available governors: " + st.available_governors);
    console.line();

    if (!st.boost)      console.line("CPU Boost: Not available");
    else if (*st.boost) console.line("CPU Boost: Enabled");
    else                console.line("CPU Boost: Disabled");

    console.line();
    console.info("Current CPU Frequencies:");
    for (const auto& f : st.frequencies) {
        std::string label = f.name;
        if (label.compare(0, 3, "cpu") == 0) label = "CPU" + label.substr(3);
        console.line(label + ": " + std::to_string(f.mhz) + " MHz");
    }
}

}  // namespace amdopt
