//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/LoopDetector.hpp
// Purpose: Declares the sampling guard against non-terminating evaluation:
//          the step counter gate and the snapshot comparison.
// Key invariants: Snapshots match only when machine state, frame stack and
//                 memory are all exactly equal; the hash is a prefilter only.
//                 The counter never overflows: it is a state machine, not a
//                 signed sentinel.
// Ownership/Lifetime: The detector owns deep copies of sampled state.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/EvalError.hpp"
#include "interp/Frame.hpp"
#include "interp/Memory.hpp"
#include "support/diagnostics.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace ember::interp
{

class Machine;

/// @brief Gate deciding on which terminator steps the detector samples.
/// @details Starts warming up; once the warmup is spent the counter becomes
///          active and fires every @p period ticks, starting with the tick
///          that completed the warmup. A zero warmup starts active at count 0,
///          so the first sample happens after one full period.
class StepCounter
{
  public:
    enum class State
    {
        WarmingUp, ///< value() is the remaining warmup.
        Active,    ///< value() is the count modulo the period.
        Disabled   ///< Detection never runs.
    };

    StepCounter(uint64_t warmup, uint64_t period);

    /// @brief Account one terminator step.
    /// @return True when the detector should sample on this step.
    bool tick();

    void disable()
    {
        state_ = State::Disabled;
    }

    [[nodiscard]] State state() const
    {
        return state_;
    }

    [[nodiscard]] uint64_t value() const
    {
        return value_;
    }

  private:
    State state_;
    uint64_t value_;
    uint64_t period_;
};

/// @brief Full machine-visible state at one sample point.
struct EvalSnapshot
{
    std::string machine;
    std::vector<Frame> stack;
    Memory memory;

    bool operator==(const EvalSnapshot &) const = default;
};

/// @brief Stores snapshots and reports a repeated state.
class LoopDetector
{
  public:
    /// @param maxSnapshots Retention bound; 0 keeps every snapshot.
    explicit LoopDetector(size_t maxSnapshots = 0);

    /// @brief Sample the current state and compare it with earlier samples.
    /// @details The first call reports a warning through @p diags that the
    ///          evaluation may take a while.
    /// @return NonTerminating when an identical state was seen before.
    EvalResult<void> observeAndAnalyze(const Machine &machine,
                                       const std::vector<Frame> &stack,
                                       const Memory &memory,
                                       support::DiagnosticEngine &diags,
                                       support::SourceLoc loc);

    [[nodiscard]] size_t snapshotCount() const
    {
        return snapshots_.size();
    }

  private:
    struct Entry
    {
        size_t hash;
        EvalSnapshot snapshot;
    };

    std::deque<Entry> snapshots_;
    size_t maxSnapshots_;
};

} // namespace ember::interp
