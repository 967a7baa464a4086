#pragma once

namespace deccalc {

enum class TokKind {
    Number,
    Operator,
};

struct Token {
    TokKind kind{TokKind::Number};
    double number{0.0}; // Number
    char op{'+'};       // Operator: one of + - * /

    static Token make_number(double v) { return Token{TokKind::Number, v, '+'}; }
    static Token make_operator(char c) { return Token{TokKind::Operator, 0.0, c}; }
};

} // namespace deccalc
