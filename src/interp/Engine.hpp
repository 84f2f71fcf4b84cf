//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Engine.hpp
// Purpose: Declares the single-step evaluation engine: frame stack, step
//          driver, statement executor, rvalue evaluator, terminator
//          dispatcher and the place/operand plumbing they share.
// Key invariants: step() performs exactly one unit of progress when the stack
//                 is non-empty. Only a `box` assignment may change the frame
//                 depth across a statement. Errors leave the engine in a
//                 terminal state.
// Ownership/Lifetime: The engine owns its frames, memory, layouts and loop
//                     detector; it borrows the module, the machine and the
//                     diagnostic engine, which must outlive it.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/EngineConfig.hpp"
#include "interp/EvalError.hpp"
#include "interp/Frame.hpp"
#include "interp/Layout.hpp"
#include "interp/LoopDetector.hpp"
#include "interp/Memory.hpp"
#include "interp/Place.hpp"
#include "interp/Trace.hpp"
#include "interp/Value.hpp"
#include "ir/Instr.hpp"
#include "ir/Module.hpp"
#include "support/diagnostics.hpp"
#include "support/source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ember::interp
{

class Machine;

/// @brief Result of a binary operator: value plus overflow flag.
struct BinaryResult
{
    Scalar value;
    bool overflowed = false;
};

/// @brief Whether executing @p stmt may legitimately push or pop frames.
bool statementMayPushFrame(const ir::Statement &stmt);

/// @brief Interpreter for IR bodies, advanced one instruction at a time.
class Engine
{
  public:
    Engine(ir::Module &module,
           Machine &machine,
           support::DiagnosticEngine &diags,
           EngineConfig config = {});

    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;

    // Frame stack -----------------------------------------------------------

    /// @brief Activate @p body with generic arguments @p substs.
    /// @param returnPlace Caller place receiving local 0 on return.
    /// @param returnTo Caller block resumed after return.
    /// @param resumeCaller Continue the caller where it stopped instead of
    ///        jumping; used by frames that machine hooks push mid-statement.
    /// @return StackOverflow when the configured depth is exceeded.
    EvalResult<void> pushFrame(const ir::Body &body,
                               std::vector<ir::TypeRef> substs,
                               std::optional<PlaceTy> returnPlace,
                               std::optional<ir::BlockId> returnTo,
                               bool resumeCaller = false);

    /// @brief Remove the current frame and release its locals.
    EvalResult<void> popFrame();

    [[nodiscard]] const std::vector<Frame> &stack() const
    {
        return stack_;
    }

    /// @brief Current (topmost) frame; requires a non-empty stack.
    Frame &frame()
    {
        return stack_.back();
    }

    const Frame &frame() const
    {
        return stack_.back();
    }

    /// @brief Index of the current frame.
    [[nodiscard]] size_t curFrame() const
    {
        return stack_.size() - 1;
    }

    // Single-step core ------------------------------------------------------

    /// @brief Execute one statement or terminator of the current frame.
    /// @return False when the stack is empty and nothing was done.
    EvalResult<bool> step();

    /// @brief Execute @p stmt and advance the index of the frame that was
    ///        current when it started.
    EvalResult<void> executeStatement(const ir::Statement &stmt);

    /// @brief Evaluate @p rvalue into @p place of the current frame.
    EvalResult<void> evalRvalueIntoPlace(const ir::Rvalue &rvalue, const ir::Place &place);

    /// @brief Execute control-flow instruction @p term.
    EvalResult<void> executeTerminator(const ir::Terminator &term);

    /// @brief Account one terminator step and sample the loop detector when due.
    EvalResult<void> incStepCounterAndDetectLoops();

    /// @brief Stop loop detection for the rest of the evaluation.
    void disableLoopDetector()
    {
        stepCounter_.disable();
    }

    // Places and operands ---------------------------------------------------

    /// @brief Resolve @p place in the current frame.
    EvalResult<PlaceTy> evalPlace(const ir::Place &place);

    /// @brief Resolve @p op in the current frame.
    /// @param hint Layout of the expected value; reused for constants when it
    ///             matches their type.
    EvalResult<OpTy> evalOperand(const ir::Operand &op, const Layout *hint = nullptr);

    /// @brief View the value stored at @p place as an operand.
    EvalResult<OpTy> placeToOp(const PlaceTy &place);

    /// @brief Read @p op as an immediate; requires a Scalar or ScalarPair layout.
    EvalResult<ValTy> readValue(const OpTy &op);

    /// @brief Read @p op as a single scalar.
    EvalResult<Scalar> readScalar(const OpTy &op);

    /// @brief Copy the value of @p src into @p dest.
    EvalResult<void> copyOp(const OpTy &src, const PlaceTy &dest);

    EvalResult<void> writeScalar(Scalar value, const PlaceTy &dest);
    EvalResult<void> writeImmediate(Immediate value, const PlaceTy &dest);

    /// @brief Ensure @p place is backed by memory, spilling an immediate
    ///        local into a fresh stack allocation.
    EvalResult<MemPlaceTy> forceAllocation(const PlaceTy &place);

    /// @brief Field @p index of @p base.
    EvalResult<PlaceTy> placeField(const PlaceTy &base, uint32_t index);

    /// @brief View @p base through the layout of enum variant @p variant.
    /// @details Same storage, narrower layout; no new allocation.
    EvalResult<PlaceTy> placeDowncast(const PlaceTy &base, uint32_t variant);

    /// @brief Element @p index of an array or slice place.
    EvalResult<PlaceTy> placeIndex(const PlaceTy &base, uint64_t index);

    EvalResult<MemPlaceTy> mplaceField(const MemPlaceTy &base, uint32_t index);

    // Discriminants ---------------------------------------------------------

    /// @brief Store the tag of @p variant into enum place @p dest.
    EvalResult<void> writeDiscriminantValue(const PlaceTy &dest, uint32_t variant);

    /// @brief Discriminant of the value at @p place; 0 for non-enums.
    EvalResult<int64_t> readDiscriminantValue(const PlaceTy &place);

    // Operators and casts ---------------------------------------------------

    EvalResult<BinaryResult> binaryOp(ir::BinOp op, const ValTy &lhs, const ValTy &rhs);

    EvalResult<Scalar> unaryOp(ir::UnOp op, Scalar value, const Layout *layout);

    /// @brief Convert @p src with @p kind and write it to @p dest.
    EvalResult<void> cast(const OpTy &src, ir::CastKind kind, const PlaceTy &dest);

    // Types and locals ------------------------------------------------------

    /// @brief Substitute the current frame's generic arguments into @p type.
    EvalResult<ir::TypeRef> monomorphize(ir::TypeRef type);

    EvalResult<const Layout *> layoutOf(ir::TypeRef type)
    {
        return layouts_.layoutOf(type);
    }

    /// @brief Begin the storage of local @p local in the current frame.
    EvalResult<void> storageLive(ir::Local local);

    /// @brief End the storage of local @p local in the current frame.
    EvalResult<void> storageDead(ir::Local local);

    // Diagnostics -----------------------------------------------------------

    /// @brief Report the contents of @p place to the trace sink.
    void dumpPlace(const PlaceTy &place);

    /// @brief Location of the instruction currently executing.
    [[nodiscard]] support::SourceLoc currentLoc() const
    {
        return loc_;
    }

    // Accessors -------------------------------------------------------------

    Memory &memory()
    {
        return memory_;
    }

    const Memory &memory() const
    {
        return memory_;
    }

    ir::Module &module()
    {
        return module_;
    }

    Machine &machine()
    {
        return machine_;
    }

    support::DiagnosticEngine &diagnostics()
    {
        return diags_;
    }

    [[nodiscard]] const EngineConfig &config() const
    {
        return config_;
    }

    [[nodiscard]] const StepCounter &stepCounter() const
    {
        return stepCounter_;
    }

    [[nodiscard]] const LoopDetector &loopDetector() const
    {
        return loopDetector_;
    }

    /// @brief Number of step() calls that made progress.
    [[nodiscard]] uint64_t stepsExecuted() const
    {
        return steps_;
    }

    [[nodiscard]] uint8_t pointerSize() const
    {
        return config_.pointerSize;
    }

  private:
    // Locals.
    EvalResult<const Layout *> localLayout(const Frame &fr, ir::Local local);
    EvalResult<void> allocateLocal(Frame &fr, ir::Local local);
    EvalResult<void> deallocateLocal(LocalValue &value);
    LocalValue &localAt(const Place &place);

    // Memory-level helpers.
    EvalResult<Immediate> readImmediateFromMem(const MemPlace &mem, const Layout *layout);
    EvalResult<void> writeImmediateToMem(Immediate value, const MemPlace &mem, const Layout *layout);
    EvalResult<int64_t> readDiscriminantAt(const MemPlace &mem, const Layout *layout);
    EvalResult<PlaceTy> derefPlace(const PlaceTy &base);

    // Rvalue helpers.
    EvalResult<void> evalAggregate(const ir::Rvalue &rvalue, const PlaceTy &dest);
    EvalResult<void> evalRepeat(const ir::Rvalue &rvalue, const PlaceTy &dest);

    // Control flow.
    EvalResult<void> evalTerminator(const ir::Terminator &term);
    EvalResult<void> gotoBlock(ir::BlockId target);
    EvalResult<void> evalSwitchInt(const ir::Terminator &term);
    EvalResult<void> evalCall(const ir::Terminator &term);
    EvalResult<void> evalReturn();
    EvalResult<void> evalAssert(const ir::Terminator &term);

    /// @brief Attach the current location to @p error when it has none.
    EvalError withLocation(EvalError error) const;

    ir::Module &module_;
    Machine &machine_;
    support::DiagnosticEngine &diags_;
    EngineConfig config_;
    TraceSink trace_;
    LayoutContext layouts_;
    Memory memory_;
    std::vector<Frame> stack_;
    StepCounter stepCounter_;
    LoopDetector loopDetector_;
    support::SourceLoc loc_{};
    uint64_t steps_ = 0;
};

} // namespace ember::interp
