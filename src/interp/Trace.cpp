//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Trace.cpp
// Purpose: Implements deterministic tracing of interpreter steps.
// Key invariants: Each event produces at most one flushed line; nothing is
//                 written when the mode is Off.
// Ownership/Lifetime: Trace sinks emit to externally owned streams.
//
//===----------------------------------------------------------------------===//

#include "interp/Trace.hpp"

#include "interp/Frame.hpp"
#include "ir/Printer.hpp"
#include "support/source_manager.hpp"

#include <iostream>

namespace ember::interp
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg), out(cfg.stream ? cfg.stream : &std::cerr) {}

/// @brief Print `[SRC] path:line:col` for @p loc, falling back to the file id
///        when no source manager is configured.
void TraceSink::emitSource(const support::SourceLoc &loc)
{
    std::ostream &os = *out;
    os << "[SRC] ";
    if (!loc.isValid())
    {
        os << "<unknown>\n";
        os.flush();
        return;
    }
    std::string_view path = cfg.sm ? cfg.sm->getPath(loc.file_id) : std::string_view{};
    if (path.empty())
        os << '#' << loc.file_id;
    else
        os << path;
    os << ':' << loc.line << ':' << loc.column << '\n';
    os.flush();
}

void TraceSink::onStatement(const ir::Statement &stmt, const Frame &fr)
{
    if (cfg.mode == TraceConfig::SRC)
    {
        emitSource(stmt.loc);
        return;
    }
    if (cfg.mode != TraceConfig::IR)
        return;
    *out << "[IR] " << fr.body->name << ":bb" << fr.block << ':' << fr.stmt << ' '
         << ir::toString(stmt) << '\n';
    out->flush();
}

void TraceSink::onTerminator(const ir::Terminator &term, const Frame &fr)
{
    if (cfg.mode == TraceConfig::SRC)
    {
        emitSource(term.loc);
        return;
    }
    if (cfg.mode != TraceConfig::IR)
        return;
    *out << "[IR] " << fr.body->name << ":bb" << fr.block << ":term " << ir::toString(term)
         << '\n';
    out->flush();
}

void TraceSink::onPlaceWritten(const std::string &place, const std::string &contents)
{
    if (cfg.mode != TraceConfig::IR)
        return;
    *out << "[IR]   " << place << " <- " << contents << '\n';
    out->flush();
}

void TraceSink::onFramePushed(const Frame &fr, size_t depth)
{
    if (cfg.mode != TraceConfig::IR)
        return;
    *out << "[IR] push " << fr.body->name << " depth=" << depth << '\n';
    out->flush();
}

void TraceSink::onFramePopped(const Frame &fr, size_t depth)
{
    if (cfg.mode != TraceConfig::IR)
        return;
    *out << "[IR] pop " << fr.body->name << " depth=" << depth << '\n';
    out->flush();
}

} // namespace ember::interp
