//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/EngineConfig.cpp
// Purpose: Implements environment overrides and validation of EngineConfig.
// Key invariants: Environment parsing never fails; bad values are dropped.
// Ownership/Lifetime: Stateless.
//
//===----------------------------------------------------------------------===//

#include "interp/EngineConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

namespace ember::interp
{

namespace
{
std::optional<uint64_t> readUnsigned(const char *name)
{
    const char *raw = std::getenv(name);
    if (!raw || *raw == '\0')
        return std::nullopt;
    char *end = nullptr;
    const unsigned long long n = std::strtoull(raw, &end, 10);
    if (end && *end == '\0')
        return static_cast<uint64_t>(n);
    return std::nullopt;
}
} // namespace

EngineConfig EngineConfig::fromEnvironment(EngineConfig base)
{
    if (const char *envTrace = std::getenv("EMBER_TRACE"))
    {
        std::string v{envTrace};
        std::transform(v.begin(),
                       v.end(),
                       v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (v == "off" || v == "0")
            base.trace.mode = TraceConfig::Off;
        else if (v == "ir")
            base.trace.mode = TraceConfig::IR;
        else if (v == "src")
            base.trace.mode = TraceConfig::SRC;
    }
    if (auto period = readUnsigned("EMBER_DETECTOR_PERIOD"))
        base.detectorPeriod = *period;
    if (auto warmup = readUnsigned("EMBER_DETECTOR_WARMUP"))
        base.detectorWarmupSteps = *warmup;
    if (auto keep = readUnsigned("EMBER_MAX_SNAPSHOTS"))
        base.maxSnapshots = static_cast<size_t>(*keep);
    return base;
}

EngineConfig EngineConfig::fromEnvironment()
{
    return fromEnvironment(EngineConfig{});
}

support::Expected<void> EngineConfig::validate() const
{
    if (detectorPeriod == 0 || (detectorPeriod & (detectorPeriod - 1)) != 0)
        return support::makeError({},
                                  "detector period " + std::to_string(detectorPeriod) +
                                      " is not a power of two");
    if (pointerSize == 0 || pointerSize > 8)
        return support::makeError({},
                                  "pointer size " + std::to_string(pointerSize) +
                                      " is outside 1..8 bytes");
    if (maxFrames == 0)
        return support::makeError({}, "the frame limit must allow at least one frame");
    return {};
}

} // namespace ember::interp
