//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the BasicBlock struct: a straight-line run of statements
// closed by exactly one terminator.  Execution enters at statement 0, runs the
// statements in order, and leaves through the terminator.  The interpreter's
// per-frame position is the pair (block, statement index); an index equal to
// statements.size() designates the terminator.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Instr.hpp"

#include <vector>

namespace ember::ir
{

/// @brief Sequence of statements terminated by a control-flow instruction.
struct BasicBlock
{
    /// Non-branching instructions in execution order.
    std::vector<Statement> statements;

    /// Control-flow instruction ending the block.
    Terminator terminator;
};

} // namespace ember::ir
