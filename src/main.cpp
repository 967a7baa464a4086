#include <deccalc/repl.hpp>

#include <iostream>
#include <string_view>

static void print_usage(std::ostream& os, const char* argv0) {
    os << "usage: " << argv0 << " [-q|--quiet] [-h|--help]\n"
       << "  -q, --quiet   do not print the banner\n"
       << "  -h, --help    show this help\n";
}

int main(int argc, char** argv) {
    deccalc::ReplOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-q" || arg == "--quiet") {
            opts.banner = false;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(std::cout, argv[0]);
            return 0;
        } else {
            std::cerr << argv[0] << ": unknown option '" << arg << "'\n";
            print_usage(std::cerr, argv[0]);
            return 2;
        }
    }

    return deccalc::run_repl(opts);
}
