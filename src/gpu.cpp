#include "gpu.hpp"

#include <filesystem>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "console.hpp"
#include "dpm_table.hpp"
#include "shell.hpp"
#include "sysfs_io.hpp"

namespace fs = std::filesystem;

namespace amdopt {

std::vector<GpuCard> find_amd_cards(const std::string& root) {
    std::vector<GpuCard> cards;
    for (auto& d : numbered_dirs(host_path(root, "/sys/class/drm"), "card")) {
        const std::string device = d.path + "/device";
        auto vendor = read_text(device + "/vendor");
        if (vendor && *vendor == kAmdGpuVendorId) cards.push_back({d.index, d.name, d.path, device});
    }
    return cards;
}

std::string control_path(const GpuCard& card, Attribute a) {
    switch (a) {
        case Attribute::PerformanceLevel: return card.device_path + "/power_dpm_force_performance_level";
        case Attribute::PowerProfile:     return card.device_path + "/pp_power_profile_mode";
        default:                          return "";
    }
}

long long millidegrees_to_celsius(long long milli) { return milli / 1000; }

std::optional<long long> read_temperature_c(const GpuCard& card) {
    for (auto& hw : numbered_dirs(card.device_path + "/hwmon", "hwmon")) {
        auto inputs = numbered_files(hw.path, "temp", "_input");
        if (inputs.empty()) continue;
        auto raw = read_text(inputs.front().path);
        if (!raw) return std::nullopt;
        try {
            return millidegrees_to_celsius(std::stoll(*raw));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<std::string> pci_slot(const GpuCard& card) {
    if (auto lines = read_lines(card.device_path + "/uevent")) {
        const std::string key = "PCI_SLOT_NAME=";
        for (const auto& l : *lines) {
            if (l.compare(0, key.size(), key) == 0) return l.substr(key.size());
        }
    }
    static const std::regex slot_re(R"([0-9a-f]{4}:[0-9a-f]{2}:[0-9a-f]{2}\.[0-9])");
    std::error_code ec;
    fs::path target = fs::read_symlink(card.device_path, ec);
    if (ec) return std::nullopt;
    std::string leaf = target.filename().string();
    if (std::regex_match(leaf, slot_re)) return leaf;
    return std::nullopt;
}

// "03:00.0 VGA compatible controller: Advanced Micro Devices ..." -> the part after the class.
static std::optional<std::string> lspci_model(const std::string& slot, Shell& shell) {
    if (!shell.has_command("lspci")) return std::nullopt;
    auto out = shell.capture("lspci -s " + shell_quote(slot) + " 2>/dev/null");
    if (!out) return std::nullopt;
    std::string first = out->substr(0, out->find('\n'));
    size_t sep = first.find(": ");
    if (sep == std::string::npos) return std::nullopt;
    std::string model = trim(first.substr(sep + 2));
    if (model.empty()) return std::nullopt;
    return model;
}

GpuStatus read_gpu_status(const GpuCard& card, Shell& shell) {
    GpuStatus st;
    st.name = card.name;
    if (auto slot = pci_slot(card)) {
        if (auto model = lspci_model(*slot, shell)) st.model = *model;
    }
    if (auto level = read_text(control_path(card, Attribute::PerformanceLevel))) {
        st.performance_level = *level;
    }
    if (auto sclk = read_text(card.device_path + "/pp_dpm_sclk")) {
        st.gpu_clock = current_value(parse_dpm_table(*sclk));
    }
    if (auto mclk = read_text(card.device_path + "/pp_dpm_mclk")) {
        st.memory_clock = current_value(parse_dpm_table(*mclk));
    }
    st.temperature_c = read_temperature_c(card);
    return st;
}

void print_gpu_status(const std::vector<GpuStatus>& cards, Console& console) {
    console.info("Detected AMD GPU(s):");
    for (const auto& st : cards) {
        console.line("  " + st.name + ": " + st.model);
        console.line("    Performance Level: " + st.performance_level);
        if (st.gpu_clock)     console.line("    Current GPU Clock: " + *st.gpu_clock);
        if (st.memory_clock)  console.line("    Current Memory Clock: " + *st.memory_clock);
        if (st.temperature_c) console.line("    Temperature: " + std::to_string(*st.temperature_c) + "°C");
    }
}

static void print_raw(const std::string& text, Console& console) {
    std::istringstream ss(text);
    std::string l;
    while (std::getline(ss, l)) console.line("  " + l);
}

static void print_dpm_file(const std::string& title, const std::string& path, Console& console) {
    auto text = read_text(path);
    if (!text) return;
    console.line(title);
    auto rows = parse_dpm_table(*text);
    if (rows.empty()) {
        print_raw(*text, console);
        return;
    }
    for (const auto& r : rows) {
        console.line("  " + std::to_string(r.index) + ": " + r.value + (r.current ? "  (current)" : ""));
    }
}

void print_gpu_clocks(const GpuCard& card, Console& console) {
    console.info(card.name + " Available Settings:");
    print_dpm_file("GPU Clocks (pp_dpm_sclk):", card.device_path + "/pp_dpm_sclk", console);
    print_dpm_file("Memory Clocks (pp_dpm_mclk):", card.device_path + "/pp_dpm_mclk", console);
    print_dpm_file("PCIe States (pp_dpm_pcie):", card.device_path + "/pp_dpm_pcie", console);

    if (auto text = read_text(control_path(card, Attribute::PowerProfile))) {
        console.line("Power Profile Modes:");
        auto rows = parse_power_profiles(*text);
        if (rows.empty()) {
            print_raw(*text, console);
        } else {
            for (const auto& r : rows) {
                console.line("  " + std::to_string(r.index) + " " + r.name + (r.current ? "  (current)" : ""));
            }
        }
    }
    console.line();
}

}  // namespace amdopt
