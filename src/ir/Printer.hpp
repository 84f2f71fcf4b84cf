//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ir/Printer.hpp
// Purpose: Declares textual rendering of IR instructions for traces and errors.
// Key invariants: Output is deterministic and single-line per instruction.
// Ownership/Lifetime: Functions return owned strings.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Instr.hpp"

#include <string>
#include <string_view>

namespace ember::ir
{

std::string_view toString(BinOp op);
std::string_view toString(UnOp op);
std::string_view toString(CastKind kind);
std::string toString(const Place &place);
std::string toString(const Operand &operand);
std::string toString(const Rvalue &rvalue);
std::string toString(const Statement &stmt);
std::string toString(const Terminator &term);

} // namespace ember::ir
