#pragma once

#include <memory>
#include <ostream>
#include <string>

namespace amdopt {

class Shell;

struct WriteResult {
    bool ok = false;
    std::string error;
};

// "Perform privileged write". The implementation is chosen once at startup.
class PrivilegedWriter {
public:
    virtual ~PrivilegedWriter() = default;
    virtual WriteResult write(const std::string& path, const std::string& value) = 0;
};

// Already running as root: write the file in-process.
class DirectWriter : public PrivilegedWriter {
public:
    WriteResult write(const std::string& path, const std::string& value) override;
};

// Not root: pipe the value into "<helper> tee <path>". The helper may prompt
// for credentials and block until answered.
class EscalatingWriter : public PrivilegedWriter {
public:
    EscalatingWriter(Shell& shell, std::string helper);
    WriteResult write(const std::string& path, const std::string& value) override;

private:
    Shell& shell_;
    std::string helper_;
};

// --dry-run: prints the write instead of performing it.
class DryRunWriter : public PrivilegedWriter {
public:
    explicit DryRunWriter(std::ostream& out);
    WriteResult write(const std::string& path, const std::string& value) override;

private:
    std::ostream& out_;
};

std::unique_ptr<PrivilegedWriter> make_privileged_writer(bool dry_run, bool is_root, Shell& shell,
                                                         const std::string& helper,
                                                         std::ostream& out);

}  // namespace amdopt
