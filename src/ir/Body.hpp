//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Body struct, the IR of one function: its locals, its
// basic blocks and its generic arity.
//
// Key Invariants:
// - Local 0 is the return place; locals 1..argCount are the arguments.
// - Block 0 is the entry block.
// - Every type mentioning Param(i) requires i < typeParamCount.
//
// Ownership Model:
// - Module owns Bodies; a Body owns its locals and blocks by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/BasicBlock.hpp"
#include "ir/Type.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ember::ir
{

/// @brief Declaration of one local variable.
struct LocalDecl
{
    TypeRef type = nullptr;
    std::string name; ///< Debug name; may be empty.
};

/// @brief Definition of an IR function.
struct Body
{
    std::string name;
    std::vector<LocalDecl> locals;
    uint32_t argCount = 0;
    uint32_t typeParamCount = 0;
    std::vector<BasicBlock> blocks;
    support::SourceLoc loc;

    [[nodiscard]] TypeRef returnType() const
    {
        return locals.empty() ? nullptr : locals.front().type;
    }
};

} // namespace ember::ir
