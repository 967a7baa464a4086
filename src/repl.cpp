#include "deccalc/repl.hpp"
#include "deccalc/decimal_format.hpp"
#include "deccalc/error.hpp"
#include "deccalc/evaluator.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#include <readline/history.h>
#include <readline/readline.h>

namespace deccalc {

std::string strip_whitespace(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (!std::isspace(static_cast<unsigned char>(c))) out.push_back(c);
    }
    return out;
}

std::optional<std::string> process_line(std::string_view raw) {
    const std::string input = strip_whitespace(raw);
    if (input.empty()) return std::nullopt;

    try {
        return format_full_decimal(evaluate_expression(input));
    } catch (const CalcError& e) {
        return std::string("Error: ") + e.what();
    }
}

// nullopt on end of input (Ctrl+D).
static std::optional<std::string> read_input(const std::string& prompt) {
    char* line = ::readline(prompt.c_str());
    if (!line) return std::nullopt;
    std::string text(line);
    std::free(line);
    add_history(text.c_str());
    return text;
}

int run_repl(const ReplOptions& opts) {
    if (opts.banner) {
        std::cout << "deccalc - exact decimal calculator\n";
        std::cout << "Enter expressions like '123+456' or '123*1e6'\n";
        std::cout << "Press Ctrl+D to exit\n";
    }

    for (;;) {
        auto line = read_input(opts.prompt);
        if (!line) break;

        if (auto out = process_line(*line)) std::cout << *out << std::endl;
    }
    return 0;
}

} // namespace deccalc
