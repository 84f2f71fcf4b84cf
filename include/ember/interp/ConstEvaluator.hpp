//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/ember/interp/ConstEvaluator.hpp
// Purpose: Declare a lightweight facade that evaluates a constant body to
//          completion without exposing engine internals.
// Invariants: Each evaluate() call runs a fresh engine; failures are reported
//             to the diagnostic engine exactly once.
// Ownership: The evaluator owns its engine and default machine; callers keep
//            ownership of the module, the diagnostics and any custom machine.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/EngineConfig.hpp"
#include "interp/EvalError.hpp"
#include "ir/Type.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace ember::ir
{
struct Module;
} // namespace ember::ir

namespace ember::support
{
class DiagnosticEngine;
} // namespace ember::support

namespace ember::interp
{
class Machine;

/// @brief Bytes of an evaluated constant.
struct ConstValue
{
    ir::TypeRef type = nullptr;
    std::vector<uint8_t> bytes;
    std::vector<bool> defined;

    /// @brief Little-endian value when every byte is defined and it fits in
    ///        64 bits.
    std::optional<uint64_t> asUint() const;

    /// @brief asUint() sign-extended from the constant's width.
    std::optional<int64_t> asInt() const;
};

/// @brief Runs bodies of a module as compile-time constants.
class ConstEvaluator
{
  public:
    /// @param machine Capability hooks; a CompileTimeMachine when null.
    ConstEvaluator(ir::Module &module,
                   support::DiagnosticEngine &diags,
                   EngineConfig config = {},
                   Machine *machine = nullptr);
    ~ConstEvaluator();

    ConstEvaluator(const ConstEvaluator &) = delete;
    ConstEvaluator &operator=(const ConstEvaluator &) = delete;

    /// @brief Evaluate the argument-free, non-generic body @p bodyName.
    EvalResult<ConstValue> evaluate(std::string_view bodyName);

    /// @brief Steps executed by the last evaluate() call.
    uint64_t stepCount() const;

  private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace ember::interp
