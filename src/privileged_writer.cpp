#include "privileged_writer.hpp"

#include <cstring>
#include <utility>

#include "shell.hpp"
#include "sysfs_io.hpp"

namespace amdopt {

WriteResult DirectWriter::write(const std::string& path, const std::string& value) {
    int e = write_text(path, value);
    if (e != 0) return {false, std::strerror(e)};
    return {true, ""};
}

EscalatingWriter::EscalatingWriter(Shell& shell, std::string helper)
    : shell_(shell), helper_(std::move(helper)) {}

WriteResult EscalatingWriter::write(const std::string& path, const std::string& value) {
    if (!shell_.has_command(helper_)) {
        return {false, helper_ + " not found; run as root instead"};
    }
    const std::string cmd = helper_ + " tee " + shell_quote(path) + " >/dev/null";
    int rc = shell_.run_with_input(cmd, value + "\n");
    if (rc != 0) {
        return {false, helper_ + " tee exited with status " + std::to_string(rc) +
                       " (check " + helper_ + " permissions)"};
    }
    return {true, ""};
}

DryRunWriter::DryRunWriter(std::ostream& out) : out_(out) {}

WriteResult DryRunWriter::write(const std::string& path, const std::string& value) {
    out_ << "  Will write: " << path << " = " << value << " (dry-run)\n";
    return {true, ""};
}

std::unique_ptr<PrivilegedWriter> make_privileged_writer(bool dry_run, bool is_root, Shell& shell,
                                                         const std::string& helper,
                                                         std::ostream& out) {
    if (dry_run) return std::make_unique<DryRunWriter>(out);
    if (is_root) return std::make_unique<DirectWriter>();
    return std::make_unique<EscalatingWriter>(shell, helper);
}

}  // namespace amdopt
