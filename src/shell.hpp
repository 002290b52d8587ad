#pragma once

#include <optional>
#include <string>

namespace amdopt {

// External commands: escalation helper, package managers, lspci.
class Shell {
public:
    virtual ~Shell() = default;

    // True if name resolves to an executable on PATH.
    virtual bool has_command(const std::string& name) = 0;

    // Runs command through /bin/sh; returns its exit status (-1 if it did not exit).
    virtual int run(const std::string& command) = 0;

    // Like run(), with input fed to the command's stdin.
    virtual int run_with_input(const std::string& command, const std::string& input) = 0;

    // stdout of command; nullopt if it could not be started or exited non-zero.
    virtual std::optional<std::string> capture(const std::string& command) = 0;
};

class SystemShell : public Shell {
public:
    bool has_command(const std::string& name) override;
    int run(const std::string& command) override;
    int run_with_input(const std::string& command, const std::string& input) override;
    std::optional<std::string> capture(const std::string& command) override;
};

// Single-quotes s for /bin/sh.
std::string shell_quote(const std::string& s);

}  // namespace amdopt
