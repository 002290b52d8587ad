#pragma once

#include <optional>
#include <string>
#include <vector>

#include "modes.hpp"

namespace amdopt {

class Console;
class Shell;

constexpr const char* kAmdGpuVendorId = "0x1002";

struct GpuCard {
    int index;
    std::string name;         // "card0"
    std::string path;         // <root>/sys/class/drm/card0
    std::string device_path;  // <root>/sys/class/drm/card0/device
};

struct GpuStatus {
    std::string name;
    std::string model = "Unknown";
    std::string performance_level = "Unknown";
    std::optional<std::string> gpu_clock;
    std::optional<std::string> memory_clock;
    std::optional<long long> temperature_c;
};

// cardN directories whose device/vendor is 0x1002, in index order.
// Connector nodes (card0-DP-1) are never returned.
std::vector<GpuCard> find_amd_cards(const std::string& root);

std::string control_path(const GpuCard& card, Attribute a);

long long millidegrees_to_celsius(long long milli);

// First hwmon temp*_input of the card, whole degrees.
std::optional<long long> read_temperature_c(const GpuCard& card);

// PCI slot from device/uevent, falling back to the device link target.
std::optional<std::string> pci_slot(const GpuCard& card);

GpuStatus read_gpu_status(const GpuCard& card, Shell& shell);

void print_gpu_status(const std::vector<GpuStatus>& cards, Console& console);

// Clock, PCIe and power profile tables of one card.
void print_gpu_clocks(const GpuCard& card, Console& console);

}  // namespace amdopt
