#pragma once

#include <optional>
#include <string>
#include <vector>

namespace amdopt {

// One state of an amdgpu pp_dpm_* file, e.g. "1: 1800Mhz *".
struct DpmRow {
    int index;
    std::string value;
    bool current;
};

// One row of pp_power_profile_mode, e.g. "  1 3D_FULL_SCREEN*:".
struct ProfileRow {
    int index;
    std::string name;
    bool current;
};

// Lines that are not "<N>: <value>[ *]" are skipped.
std::vector<DpmRow> parse_dpm_table(const std::string& text);

// Accepts the legacy (Vega), per-clock-type (Navi) and compact (APU) layouts.
// Header lines and per-clock sub-rows are skipped.
std::vector<ProfileRow> parse_power_profiles(const std::string& text);

std::optional<std::string> current_value(const std::vector<DpmRow>& rows);

}  // namespace amdopt
