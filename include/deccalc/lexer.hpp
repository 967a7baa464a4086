#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "deccalc/error.hpp"
#include "deccalc/token.hpp"

namespace deccalc {

// Splits a whitespace-free expression into Number and Operator tokens.
// A sign directly after 'e'/'E' belongs to the number's exponent.
class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}

    /// Throws InvalidCharacter or InvalidNumber; nothing is returned on failure.
    std::vector<Token> tokenize();

private:
    void flush_number(std::vector<Token>& out);
    bool is_end() const { return i_ >= s_.size(); }

    std::string_view s_;
    std::size_t i_{0};
    std::string pending_{};
};

inline std::vector<Token> tokenize(std::string_view s) { return Lexer(s).tokenize(); }

} // namespace deccalc
