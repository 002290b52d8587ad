#include "sysfs_io.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <system_error>

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace amdopt {

static bool is_trailing_space(char c) {
    return c == '\n' || c == '\r' || c == ' ' || c == '\t';
}

std::optional<std::string> read_text(const std::string& path) {
    for (int attempt = 0; attempt < 3; ++attempt) {
        int fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0) {
            if (errno == EAGAIN) { ::usleep(1000); continue; }
            return std::nullopt;
        }
        // pp_power_profile_mode can be larger than one page on newer parts.
        std::string s;
        char buf[4096];
        ssize_t n = 0;
        while ((n = ::read(fd, buf, sizeof(buf))) > 0) s.append(buf, static_cast<size_t>(n));
        int e = errno;
        ::close(fd);

        if (n < 0) {
            if (e == EAGAIN) { ::usleep(1000); continue; }
            return std::nullopt;
        }
        while (!s.empty() && is_trailing_space(s.back())) s.pop_back();
        return s;
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> read_lines(const std::string& path) {
    auto text = read_text(path);
    if (!text) return std::nullopt;
    std::vector<std::string> out;
    std::istringstream ss(*text);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(line);
    }
    return out;
}

int write_text(const std::string& path, const std::string& val) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) return errno;
    std::string v = val;
    if (v.empty() || v.back() != '\n') v.push_back('\n');
    ssize_t n = ::write(fd, v.c_str(), v.size());
    int e = (n < 0) ? errno : 0;
    if (::close(fd) != 0 && e == 0) e = errno;
    if (e != 0) return e;
    return n == static_cast<ssize_t>(v.size()) ? 0 : EIO;
}

bool exists(const std::string& p) {
    std::error_code ec;
    return fs::exists(p, ec);
}

static std::optional<int> numbered_suffix(const std::string& name, const std::string& prefix,
                                          const std::string& suffix) {
    if (name.size() <= prefix.size() + suffix.size()) return std::nullopt;
    if (name.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return std::nullopt;
    std::string digits = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    if (digits.size() > 9) return std::nullopt;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return std::stoi(digits);
}

static std::vector<NumberedDir> numbered_entries(const std::string& root, const std::string& prefix,
                                                 const std::string& suffix, bool dirs_only) {
    std::vector<NumberedDir> out;
    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) return out;
    for (auto const& e : it) {
        std::string name = e.path().filename().string();
        auto n = numbered_suffix(name, prefix, suffix);
        if (!n) continue;
        std::error_code dec;
        if (dirs_only && !e.is_directory(dec)) continue;
        out.push_back({*n, name, e.path().string()});
    }
    std::sort(out.begin(), out.end(),
              [](const NumberedDir& a, const NumberedDir& b) { return a.index < b.index; });
    return out;
}

std::vector<NumberedDir> numbered_dirs(const std::string& root, const std::string& prefix) {
    return numbered_entries(root, prefix, "", true);
}

std::vector<NumberedDir> numbered_files(const std::string& root, const std::string& prefix,
                                        const std::string& suffix) {
    return numbered_entries(root, prefix, suffix, false);
}

std::string trim(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string host_path(const std::string& root, const std::string& abs) {
    if (root.empty()) return abs;
    if (root.back() == '/') return root.substr(0, root.size() - 1) + abs;
    return root + abs;
}

}  // namespace amdopt
