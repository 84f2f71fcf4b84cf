//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Trace.hpp
// Purpose: Declares tracing configuration and the sink that reports executed
//          instructions, written places and frame transitions.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: The sink borrows its output stream and source manager.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>

namespace ember::ir
{
struct Statement;
struct Terminator;
} // namespace ember::ir

namespace ember::support
{
class SourceManager;
struct SourceLoc;
} // namespace ember::support

namespace ember::interp
{
struct Frame;

/// @brief Configuration for interpreter tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off, ///< Tracing disabled
        IR,  ///< Trace IR instructions and written places
        SRC  ///< Trace source locations
    } mode{Off};

    /// @brief Optional source manager for resolving file paths.
    const support::SourceManager *sm = nullptr;

    /// @brief Destination of trace lines; std::cerr when null.
    std::ostream *stream = nullptr;

    /// @brief Check whether tracing is enabled.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record execution of statement @p stmt in frame @p fr.
    void onStatement(const ir::Statement &stmt, const Frame &fr);

    /// @brief Record execution of terminator @p term in frame @p fr.
    void onTerminator(const ir::Terminator &term, const Frame &fr);

    /// @brief Report the contents of a place after an assignment (IR mode).
    void onPlaceWritten(const std::string &place, const std::string &contents);

    /// @brief Record a new activation at stack depth @p depth.
    void onFramePushed(const Frame &fr, size_t depth);

    /// @brief Record the end of an activation at stack depth @p depth.
    void onFramePopped(const Frame &fr, size_t depth);

    [[nodiscard]] const TraceConfig &config() const
    {
        return cfg;
    }

  private:
    void emitSource(const support::SourceLoc &loc);

    TraceConfig cfg;
    std::ostream *out;
};

} // namespace ember::interp
