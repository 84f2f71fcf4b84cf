//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/EngineConfig.hpp
// Purpose: Declares tunables of the evaluation engine and their environment
//          overrides.
// Key invariants: A validated configuration has a power-of-two detector
//                 period, a non-zero pointer size and room for one frame.
// Ownership/Lifetime: Plain value type; the trace source manager is borrowed.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/Trace.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>

namespace ember::interp
{

struct EngineConfig
{
    /// Terminator steps between loop detector samples.
    uint64_t detectorPeriod = 256;

    /// Terminator steps before the loop detector takes its first sample.
    uint64_t detectorWarmupSteps = 1'000'000;

    /// Snapshots retained by the loop detector; 0 keeps all of them.
    size_t maxSnapshots = 0;

    /// Width of references and `usize` in bytes.
    uint8_t pointerSize = 8;

    /// Deepest frame stack before a call fails with StackOverflow.
    size_t maxFrames = 256;

    TraceConfig trace;

    /// @brief Apply EMBER_TRACE, EMBER_DETECTOR_PERIOD, EMBER_DETECTOR_WARMUP
    ///        and EMBER_MAX_SNAPSHOTS on top of @p base.
    /// @details Malformed values are ignored and leave the field unchanged.
    static EngineConfig fromEnvironment(EngineConfig base);

    /// @brief Environment overrides applied to the default configuration.
    static EngineConfig fromEnvironment();

    /// @brief Check the invariants listed in the file header.
    support::Expected<void> validate() const;
};

} // namespace ember::interp
