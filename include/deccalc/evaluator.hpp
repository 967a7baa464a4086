#pragma once
#include <string_view>
#include <vector>
#include "deccalc/error.hpp"
#include "deccalc/token.hpp"

namespace deccalc {

/// Apply a single binary operator.
/// Throws DivisionByZero when op is '/' and rhs == 0, InvalidOperator for
/// anything but + - * /.
double apply_operation(double lhs, double rhs, char op);

/// Fold tokens left to right, starting from 0 with a pending '+'.
/// There is no precedence: "2+3*4" is ((0+2)+3)*4.
double evaluate(const std::vector<Token>& tokens);

/// tokenize + evaluate.
double evaluate_expression(std::string_view expr);

} // namespace deccalc
