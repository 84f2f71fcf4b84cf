//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/EvalError.cpp
// Purpose: Implements construction and diagnostic conversion of evaluation errors.
// Key invariants: Diagnostic text always starts with the error kind name.
// Ownership/Lifetime: Stateless helpers.
//
//===----------------------------------------------------------------------===//

#include "interp/EvalError.hpp"

#include <utility>

namespace ember::interp
{

EvalError makeEvalError(EvalErrorKind kind, std::string message, support::SourceLoc loc)
{
    return EvalError{kind, std::move(message), loc};
}

support::Diagnostic toDiagnostic(const EvalError &error)
{
    std::string text(toString(error.kind));
    if (!error.message.empty())
        text += ": " + error.message;
    if (error.isBug())
        text += " (this is a bug in the code that produced the IR)";
    return support::makeError(error.loc, std::move(text));
}

} // namespace ember::interp
