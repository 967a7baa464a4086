#include "deccalc/lexer.hpp"
#include <cctype>
#include <cstdlib>

namespace deccalc {

static bool is_number_char(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == 'e' || c == 'E';
}

static bool is_operator_char(char c) {
    return c == '+' || c == '-' || c == '*' || c == '/';
}

// The complete UTF-8 sequence starting at s[i], so error messages never end
// in half a character. Malformed sequences yield just the bytes present.
static std::string char_at(std::string_view s, std::size_t i) {
    const auto lead = static_cast<unsigned char>(s[i]);
    std::size_t len = 1;
    if (lead >= 0xC0 && lead < 0xE0) len = 2;
    else if (lead >= 0xE0 && lead < 0xF0) len = 3;
    else if (lead >= 0xF0 && lead < 0xF8) len = 4;

    std::size_t n = 1;
    while (n < len && i + n < s.size() && (static_cast<unsigned char>(s[i + n]) & 0xC0) == 0x80) ++n;
    return std::string(s.substr(i, n));
}

// The whole literal has to parse; strtod accepting a prefix ("12." of "12..3")
// is still an error. Out-of-range literals come back as +-HUGE_VAL and are kept.
static double parse_number(const std::string& text) {
    const char* begin = text.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin || static_cast<std::size_t>(end - begin) != text.size())
        throw InvalidNumber("Invalid number: " + text);
    return v;
}

void Lexer::flush_number(std::vector<Token>& out) {
    if (pending_.empty()) return;
    out.push_back(Token::make_number(parse_number(pending_)));
    pending_.clear();
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;
    i_ = 0;
    pending_.clear();

    while (!is_end()) {
        char c = s_[i_];

        if (is_number_char(c)) {
            pending_.push_back(c);
            // exponent sign: "1e-3" is one literal, not 1e minus 3
            if ((c == 'e' || c == 'E') && i_ + 1 < s_.size() && (s_[i_ + 1] == '+' || s_[i_ + 1] == '-')) {
                pending_.push_back(s_[i_ + 1]);
                ++i_;
            }
        } else if (is_operator_char(c)) {
            flush_number(out);
            out.push_back(Token::make_operator(c));
        } else {
            throw InvalidCharacter("Invalid character: " + char_at(s_, i_));
        }
        ++i_;
    }

    flush_number(out);
    return out;
}

} // namespace deccalc
