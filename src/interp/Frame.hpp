//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Frame.hpp
// Purpose: Declares an activation record of the interpreter.
// Key invariants: `stmt` indexes the next statement of `block`; when it equals
//                 the statement count the block's terminator is next.
// Ownership/Lifetime: Frames live in the engine's stack; they borrow the body
//                     from the module.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/Place.hpp"
#include "interp/Value.hpp"
#include "ir/Body.hpp"
#include "support/source_location.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace ember::interp
{

/// @brief Storage state of one local.
struct LocalValue
{
    enum class State
    {
        Dead,      ///< Outside its storage range.
        Immediate, ///< Held by value in @ref imm.
        Indirect   ///< Backed by the stack allocation @ref ptr.
    };

    State state = State::Dead;
    Immediate imm{};
    Pointer ptr{};

    bool operator==(const LocalValue &) const = default;
};

/// @brief Activation record.
struct Frame
{
    const ir::Body *body = nullptr;

    /// Generic arguments of this instantiation.
    std::vector<ir::TypeRef> substs;

    std::vector<LocalValue> locals;

    ir::BlockId block = 0;
    size_t stmt = 0;

    /// Location of the instruction being executed.
    support::SourceLoc loc{};

    /// Caller place receiving the return value; empty when discarded.
    std::optional<PlaceTy> returnPlace;

    /// Caller block resumed after return; empty for diverging calls and the
    /// entry frame.
    std::optional<ir::BlockId> returnTo;

    /// Caller continues at its current position on return.
    bool resumeCaller = false;

    bool operator==(const Frame &) const = default;
};

} // namespace ember::interp
