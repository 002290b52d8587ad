#include "shell.hpp"

#include <cstdio>
#include <cstdlib>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

namespace amdopt {

static int exit_status(int raw) {
    if (raw == -1) return -1;
    if (WIFEXITED(raw)) return WEXITSTATUS(raw);
    return -1;
}

bool SystemShell::has_command(const std::string& name) {
    if (name.empty()) return false;
    if (name.find('/') != std::string::npos) return ::access(name.c_str(), X_OK) == 0;

    const char* path = std::getenv("PATH");
    std::istringstream ss(path ? path : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) return true;
    }
    return false;
}

int SystemShell::run(const std::string& command) {
    std::fflush(stdout);
    return exit_status(std::system(command.c_str()));
}

int SystemShell::run_with_input(const std::string& command, const std::string& input) {
    std::fflush(stdout);
    FILE* pipe = ::popen(command.c_str(), "w");
    if (!pipe) return -1;
    size_t n = std::fwrite(input.data(), 1, input.size(), pipe);
    int rc = exit_status(::pclose(pipe));
    if (n != input.size() && rc == 0) return -1;
    return rc;
}

std::optional<std::string> SystemShell::capture(const std::string& command) {
    FILE* pipe = ::popen(command.c_str(), "r");
    if (!pipe) return std::nullopt;
    std::string out;
    char buf[512];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) out.append(buf, n);
    if (exit_status(::pclose(pipe)) != 0) return std::nullopt;
    return out;
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

}  // namespace amdopt
