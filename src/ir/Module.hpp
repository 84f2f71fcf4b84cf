//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ir/Module.hpp
// Purpose: Declares the Module container of bodies and types.
// Key invariants: Body names are unique; bodies never move once added.
// Ownership/Lifetime: Module owns its TypeContext and every Body.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Body.hpp"
#include "ir/Type.hpp"

#include <deque>
#include <string_view>

namespace ember::ir
{

/// @brief Translation unit handed to the interpreter.
struct Module
{
    explicit Module(unsigned pointerBits = 64) : types(pointerBits) {}

    /// Interned types referenced by the bodies.
    TypeContext types;

    /// Bodies; a deque keeps references stable while more bodies are added.
    std::deque<Body> bodies;

    /// @brief Look up body @p name.
    /// @return Pointer into @ref bodies or nullptr when absent.
    const Body *findBody(std::string_view name) const;
};

} // namespace ember::ir
