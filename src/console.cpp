#include "console.hpp"

#include <cstdlib>

#include <unistd.h>

namespace amdopt {

static const char* kRed    = "\033[0;31m";
static const char* kGreen  = "\033[0;32m";
static const char* kYellow = "\033[1;33m";
static const char* kBlue   = "\033[0;34m";
static const char* kReset  = "\033[0m";

Console::Console(std::ostream& out, std::ostream& err, bool color)
    : Console(out, err, color, color) {}

Console::Console(std::ostream& out, std::ostream& err, bool out_color, bool err_color)
    : out_(out), err_(err), out_color_(out_color), err_color_(err_color) {}

void Console::tagged(std::ostream& os, bool color, const char* ansi, const char* tag,
                     const std::string& msg) {
    if (color) os << ansi << tag << kReset << " " << msg << "\n";
    else       os << tag << " " << msg << "\n";
}

void Console::status(const std::string& msg)  { tagged(out_, out_color_, kGreen,  "[✓]", msg); }
void Console::warning(const std::string& msg) { tagged(out_, out_color_, kYellow, "[⚠]", msg); }
void Console::error(const std::string& msg)   { tagged(out_, out_color_, kRed,    "[✗]", msg); }
void Console::info(const std::string& msg)    { tagged(out_, out_color_, kBlue,   "[ℹ]", msg); }
void Console::fatal(const std::string& msg)   { tagged(err_, err_color_, kRed,    "[✗]", msg); }

void Console::line(const std::string& msg) { out_ << msg << "\n"; }

void Console::banner(const std::string& name, const std::string& version) {
    out_ << "========================================\n"
         << "  " << name << " v" << version << "\n"
         << "========================================\n\n";
}

bool color_enabled(bool no_color_flag, int fd) {
    if (no_color_flag) return false;
    const char* nc = std::getenv("NO_COLOR");
    if (nc && *nc) return false;
    return ::isatty(fd) == 1;
}

}  // namespace amdopt
