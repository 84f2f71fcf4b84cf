//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Machine.hpp
// Purpose: Declares the capability hooks an evaluation client plugs into the
//          engine, and the baseline compile-time client.
// Key invariants: Hooks run synchronously inside the statement that triggered
//                 them. boxAlloc is the only hook allowed to push frames.
// Ownership/Lifetime: The engine borrows its Machine; the client owns it.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/EvalError.hpp"
#include "interp/Place.hpp"
#include "ir/Instr.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace ember::interp
{

class Engine;

/// @brief Client-specific behaviour of the abstract machine.
class Machine
{
  public:
    virtual ~Machine() = default;

    /// @brief Handle a validation marker.
    virtual EvalResult<void> validationOp(Engine &engine,
                                          ir::ValidationOp op,
                                          std::span<const ir::ValidationOperand> operands) = 0;

    /// @brief Handle the end of region @p region (empty for the anonymous one).
    virtual EvalResult<void> endRegion(Engine &engine, std::optional<uint32_t> region) = 0;

    /// @brief Allocate heap storage for a `box` and write the pointer to @p dest.
    virtual EvalResult<void> boxAlloc(Engine &engine, const PlaceTy &dest) = 0;

    /// @brief Client state that takes part in loop detection.
    /// @details Two snapshots only match when these strings are equal.
    virtual std::string snapshotState() const
    {
        return {};
    }
};

/// @brief Machine used for constant evaluation: no heap, no validation.
class CompileTimeMachine final : public Machine
{
  public:
    EvalResult<void> validationOp(Engine &engine,
                                  ir::ValidationOp op,
                                  std::span<const ir::ValidationOperand> operands) override;
    EvalResult<void> endRegion(Engine &engine, std::optional<uint32_t> region) override;
    EvalResult<void> boxAlloc(Engine &engine, const PlaceTy &dest) override;
};

} // namespace ember::interp
