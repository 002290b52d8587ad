#include "dpm_table.hpp"

#include <cctype>
#include <sstream>

#include "sysfs_io.hpp"

namespace amdopt {

static bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
static bool is_blank(char c) { return c == ' ' || c == '\t'; }

// Parses a leading decimal index at s[i]; advances i past it.
static std::optional<int> take_index(const std::string& s, size_t& i) {
    size_t start = i;
    while (i < s.size() && is_digit(s[i])) ++i;
    if (i == start || i - start > 9) return std::nullopt;
    return std::stoi(s.substr(start, i - start));
}

std::vector<DpmRow> parse_dpm_table(const std::string& text) {
    std::vector<DpmRow> rows;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        size_t i = 0;
        while (i < line.size() && is_blank(line[i])) ++i;
        auto idx = take_index(line, i);
        if (!idx || i >= line.size() || line[i] != ':') continue;

        std::string value = trim(line.substr(i + 1));
        bool current = false;
        if (!value.empty() && value.back() == '*') {
            current = true;
            value.pop_back();
            value = trim(value);
        }
        if (value.empty()) continue;
        rows.push_back({*idx, value, current});
    }
    return rows;
}

std::vector<ProfileRow> parse_power_profiles(const std::string& text) {
    std::vector<ProfileRow> rows;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        size_t i = 0;
        while (i < line.size() && is_blank(line[i])) ++i;
        auto idx = take_index(line, i);
        if (!idx || i >= line.size() || !is_blank(line[i])) continue;
        while (i < line.size() && is_blank(line[i])) ++i;

        size_t name_start = i;
        bool has_alpha = false;
        while (i < line.size() &&
               (std::isalnum(static_cast<unsigned char>(line[i])) || line[i] == '_')) {
            if (std::isalpha(static_cast<unsigned char>(line[i]))) has_alpha = true;
            ++i;
        }
        if (i == name_start || !has_alpha) continue;
        std::string name = line.substr(name_start, i - name_start);

        while (i < line.size() && is_blank(line[i])) ++i;
        if (i < line.size() && line[i] != '*' && line[i] != ':') continue;
        bool current = i < line.size() && line[i] == '*';
        rows.push_back({*idx, name, current});
    }
    return rows;
}

std::optional<std::string> current_value(const std::vector<DpmRow>& rows) {
    for (const auto& r : rows) {
        if (r.current) return r.value;
    }
    return std::nullopt;
}

}  // namespace amdopt
