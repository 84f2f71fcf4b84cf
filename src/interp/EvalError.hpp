//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/EvalError.hpp
// Purpose: Defines the evaluation error taxonomy and the result alias used by
//          every fallible interpreter operation.
// Key invariants: Enum values are stable; toString() names are used verbatim
//                 in diagnostics.
// Ownership/Lifetime: Errors are value types.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace ember::interp
{

/// @brief Categorises evaluation failures for diagnostic reporting.
enum class EvalErrorKind : int32_t
{
    UnsupportedFeature = 0,    ///< Construct this machine refuses to execute.
    InvalidValue = 1,          ///< Read of undefined bytes or a dead local.
    NonTerminating = 2,        ///< Loop detector saw a repeated machine state.
    InternalInconsistency = 3, ///< Upstream contract violation (compiler bug).
    DivisionByZero = 4,        ///< Integer division or remainder by zero.
    Overflow = 5,              ///< Arithmetic overflow reported as an error.
    OutOfBounds = 6,           ///< Memory access or index outside its allocation.
    InvalidDiscriminant = 7,   ///< Tag does not name any variant.
    DanglingPointer = 8,       ///< Access through a deallocated allocation.
    Unreachable = 9,           ///< Entered code the program declared unreachable.
    InvalidCast = 10,          ///< Conversion not defined for the operand types.
    StackOverflow = 11,        ///< Frame stack exceeded its configured depth.
};

/// @brief Convert error kind to canonical diagnostic string.
constexpr std::string_view toString(EvalErrorKind kind) noexcept
{
    switch (kind)
    {
        case EvalErrorKind::UnsupportedFeature:
            return "UnsupportedFeature";
        case EvalErrorKind::InvalidValue:
            return "InvalidValue";
        case EvalErrorKind::NonTerminating:
            return "NonTerminating";
        case EvalErrorKind::InternalInconsistency:
            return "InternalInconsistency";
        case EvalErrorKind::DivisionByZero:
            return "DivisionByZero";
        case EvalErrorKind::Overflow:
            return "Overflow";
        case EvalErrorKind::OutOfBounds:
            return "OutOfBounds";
        case EvalErrorKind::InvalidDiscriminant:
            return "InvalidDiscriminant";
        case EvalErrorKind::DanglingPointer:
            return "DanglingPointer";
        case EvalErrorKind::Unreachable:
            return "Unreachable";
        case EvalErrorKind::InvalidCast:
            return "InvalidCast";
        case EvalErrorKind::StackOverflow:
            return "StackOverflow";
    }
    return "InternalInconsistency";
}

/// @brief Structured evaluation failure.
struct EvalError
{
    EvalErrorKind kind = EvalErrorKind::InternalInconsistency;
    std::string message;
    support::SourceLoc loc{}; ///< Filled from the current instruction when unknown.

    /// @brief Whether the error signals a bug in the surrounding compiler
    ///        rather than a property of the evaluated program.
    [[nodiscard]] bool isBug() const noexcept
    {
        return kind == EvalErrorKind::InternalInconsistency;
    }
};

/// @brief Result of a fallible interpreter operation.
template <class T> using EvalResult = support::Expected<T, EvalError>;

/// @brief Build an error of @p kind with @p message.
EvalError makeEvalError(EvalErrorKind kind, std::string message, support::SourceLoc loc = {});

/// @brief Render @p error as an error-severity diagnostic "Kind: message".
support::Diagnostic toDiagnostic(const EvalError &error);

} // namespace ember::interp
