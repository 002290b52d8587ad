#pragma once

#include <string>
#include <vector>

namespace amdopt {

class Console;
class PrivilegedWriter;
class Shell;

struct Options {
    std::string verb = "status";
    std::vector<std::string> args;  // positionals after the verb
    std::string root;               // --root <dir>
    std::string sudo = "sudo";      // --sudo <cmd>
    bool dry_run = false;           // --dry-run
    bool no_color = false;          // --no-color
};

// Flags may appear anywhere; the first positional is the verb.
Options parse_options(int argc, char** argv);

bool is_help_verb(const std::string& verb);

// Everything a verb needs, built once in main.
struct Context {
    std::string root;
    Console& console;
    Shell& shell;
    PrivilegedWriter& writer;
    bool is_root = false;
    std::string sudo = "sudo";
};

}  // namespace amdopt
