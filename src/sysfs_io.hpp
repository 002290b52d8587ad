#pragma once

#include <optional>
#include <string>
#include <vector>

namespace amdopt {

// Reads a whole sysfs/procfs file, trailing whitespace trimmed.
// nullopt when the file is missing or unreadable.
std::optional<std::string> read_text(const std::string& path);

// Same as read_text, split into lines (trailing '\r' removed).
std::optional<std::vector<std::string>> read_lines(const std::string& path);

// Writes val (newline appended) to path, creating the file if needed.
// Returns 0 on success, errno otherwise.
int write_text(const std::string& path, const std::string& val);

bool exists(const std::string& p);

// A directory named <prefix><N> under a root, e.g. cpu3 or card0.
struct NumberedDir {
    int index;
    std::string name;
    std::string path;
};

// Directories under root named prefix followed only by digits, sorted by N.
std::vector<NumberedDir> numbered_dirs(const std::string& root, const std::string& prefix);

// Files (any type) under root named <prefix><N><suffix>, sorted by N.
std::vector<NumberedDir> numbered_files(const std::string& root, const std::string& prefix,
                                        const std::string& suffix);

std::string trim(const std::string& s);

// Maps an absolute host path like "/sys/class/drm" under an alternate root.
std::string host_path(const std::string& root, const std::string& abs);

}  // namespace amdopt
