#pragma once

#include <ostream>
#include <string>

namespace amdopt {

// Colored status lines:
//   [✓] status   green
//   [⚠] warning  yellow
//   [✗] error    red
//   [ℹ] info     blue
// Reports go to out; fatal() and usage on bad input go to err.
class Console {
public:
    Console(std::ostream& out, std::ostream& err, bool color);
    Console(std::ostream& out, std::ostream& err, bool out_color, bool err_color);

    void status(const std::string& msg);
    void warning(const std::string& msg);
    void error(const std::string& msg);
    void info(const std::string& msg);
    void fatal(const std::string& msg);
    void line(const std::string& msg = "");
    void banner(const std::string& name, const std::string& version);

    std::ostream& out() { return out_; }
    std::ostream& err() { return err_; }

private:
    void tagged(std::ostream& os, bool color, const char* ansi, const char* tag, const std::string& msg);

    std::ostream& out_;
    std::ostream& err_;
    bool out_color_;
    bool err_color_;
};

// False with --no-color, when NO_COLOR is set, or when fd is not a tty.
bool color_enabled(bool no_color_flag, int fd);

}  // namespace amdopt
