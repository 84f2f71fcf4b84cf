//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Machine.cpp
// Purpose: Implements the compile-time machine's capability hooks.
// Key invariants: None of the hooks touch engine state.
// Ownership/Lifetime: Stateless.
//
//===----------------------------------------------------------------------===//

#include "interp/Machine.hpp"

namespace ember::interp
{

EvalResult<void> CompileTimeMachine::validationOp(Engine &,
                                                  ir::ValidationOp,
                                                  std::span<const ir::ValidationOperand>)
{
    return {};
}

EvalResult<void> CompileTimeMachine::endRegion(Engine &, std::optional<uint32_t>)
{
    return {};
}

EvalResult<void> CompileTimeMachine::boxAlloc(Engine &, const PlaceTy &)
{
    return makeEvalError(EvalErrorKind::UnsupportedFeature,
                         "heap allocations via `box` are not supported in constants");
}

} // namespace ember::interp
