#include "deccalc/evaluator.hpp"
#include "deccalc/lexer.hpp"

#include <string>

namespace deccalc {

double apply_operation(double lhs, double rhs, char op) {
    switch (op) {
        case '+': return lhs + rhs;
        case '-': return lhs - rhs;
        case '*': return lhs * rhs;
        case '/':
            if (rhs == 0.0) throw DivisionByZero("Division by zero!");
            return lhs / rhs;
        default: break;
    }
    throw InvalidOperator(std::string("Invalid operator: ") + op);
}

double evaluate(const std::vector<Token>& tokens) {
    double acc = 0.0;
    char pending = '+'; // a leading number is added to the implicit zero

    for (const auto& t : tokens) {
        switch (t.kind) {
            case TokKind::Operator:
                pending = t.op;
                break;

            case TokKind::Number:
                acc = apply_operation(acc, t.number, pending);
                break;
        }
    }
    return acc;
}

double evaluate_expression(std::string_view expr) {
    return evaluate(tokenize(expr));
}

} // namespace deccalc
