#include "cli.hpp"

namespace amdopt {

Options parse_options(int argc, char** argv) {
    Options opts;
    bool have_verb = false;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--root" && i + 1 < argc) { opts.root = argv[++i]; continue; }
        if (a == "--sudo" && i + 1 < argc) { opts.sudo = argv[++i]; continue; }
        if (a == "--dry-run")  { opts.dry_run = true; continue; }
        if (a == "--no-color") { opts.no_color = true; continue; }

        if (!have_verb) {
            opts.verb = a;
            have_verb = true;
        } else {
            opts.args.push_back(a);
        }
    }
    return opts;
}

bool is_help_verb(const std::string& verb) {
    return verb == "help" || verb == "-h" || verb == "--help";
}

}  // namespace amdopt
