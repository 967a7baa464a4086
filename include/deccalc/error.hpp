#pragma once
#include <stdexcept>

namespace deccalc {

// Every error raised while evaluating one input line. All of them are
// recoverable: the caller reports what() and moves on to the next line.
struct CalcError : std::runtime_error { using std::runtime_error::runtime_error; };

struct InvalidCharacter : CalcError { using CalcError::CalcError; };
struct InvalidNumber    : CalcError { using CalcError::CalcError; };
struct InvalidOperator  : CalcError { using CalcError::CalcError; };
struct DivisionByZero   : CalcError { using CalcError::CalcError; };

} // namespace deccalc
