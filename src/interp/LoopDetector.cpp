//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/LoopDetector.cpp
// Purpose: Implements step gating and snapshot comparison for loop detection.
// Key invariants: A NonTerminating error is only produced after an exact
//                 structural match.
// Ownership/Lifetime: See LoopDetector.hpp.
//
//===----------------------------------------------------------------------===//

#include "interp/LoopDetector.hpp"

#include "interp/Machine.hpp"

#include <functional>
#include <utility>

namespace ember::interp
{

namespace
{
void hashCombine(size_t &seed, size_t value)
{
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

void hashScalar(size_t &seed, const Scalar &s)
{
    hashCombine(seed, static_cast<size_t>(s.kind));
    hashCombine(seed, std::hash<uint64_t>{}(s.bits));
    hashCombine(seed, std::hash<uint64_t>{}(s.ptr.alloc));
    hashCombine(seed, std::hash<uint64_t>{}(s.ptr.offset));
}

/// @brief Hash of the machine string and the frame stack; memory is left to
///        the exact comparison.
size_t hashState(const std::string &machine, const std::vector<Frame> &stack)
{
    size_t seed = std::hash<std::string>{}(machine);
    for (const Frame &fr : stack)
    {
        hashCombine(seed, std::hash<const void *>{}(fr.body));
        hashCombine(seed, fr.block);
        hashCombine(seed, fr.stmt);
        for (const LocalValue &lv : fr.locals)
        {
            hashCombine(seed, static_cast<size_t>(lv.state));
            hashScalar(seed, lv.imm.first);
            hashScalar(seed, lv.imm.second);
            hashCombine(seed, std::hash<uint64_t>{}(lv.ptr.alloc));
        }
    }
    return seed;
}
} // namespace

StepCounter::StepCounter(uint64_t warmup, uint64_t period)
    : state_(warmup > 0 ? State::WarmingUp : State::Active), value_(warmup), period_(period)
{
    if (period_ == 0)
        state_ = State::Disabled;
}

bool StepCounter::tick()
{
    switch (state_)
    {
        case State::Disabled:
            return false;
        case State::WarmingUp:
            if (--value_ > 0)
                return false;
            state_ = State::Active;
            return true;
        case State::Active:
            value_ = (value_ + 1) % period_;
            return value_ == 0;
    }
    return false;
}

LoopDetector::LoopDetector(size_t maxSnapshots) : maxSnapshots_(maxSnapshots) {}

EvalResult<void> LoopDetector::observeAndAnalyze(const Machine &machine,
                                                 const std::vector<Frame> &stack,
                                                 const Memory &memory,
                                                 support::DiagnosticEngine &diags,
                                                 support::SourceLoc loc)
{
    if (snapshots_.empty())
        diags.report(support::makeWarning(
            loc, "Constant evaluating a complex constant, this might take some time"));

    EvalSnapshot snapshot{machine.snapshotState(), stack, memory};
    const size_t hash = hashState(snapshot.machine, snapshot.stack);
    for (const Entry &e : snapshots_)
    {
        if (e.hash == hash && e.snapshot == snapshot)
            return makeEvalError(EvalErrorKind::NonTerminating,
                                 "evaluation reached an identical machine state twice and "
                                 "will never terminate",
                                 loc);
    }

    snapshots_.push_back(Entry{hash, std::move(snapshot)});
    if (maxSnapshots_ != 0 && snapshots_.size() > maxSnapshots_)
        snapshots_.pop_front();
    return {};
}

} // namespace ember::interp
