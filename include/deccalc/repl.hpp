#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace deccalc {

struct ReplOptions {
    std::string prompt{"> "};
    bool banner{true};
};

/// Strip all whitespace from a raw input line.
std::string strip_whitespace(std::string_view raw);

/// Run one input line through the whole pipeline.
/// Returns the formatted result or "Error: <message>", or nullopt when the
/// line holds nothing but whitespace.
std::optional<std::string> process_line(std::string_view raw);

/// Interactive loop on the terminal. Returns the process exit status.
int run_repl(const ReplOptions& opts);

} // namespace deccalc
