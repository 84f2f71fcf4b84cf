//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic helpers that accompany the Expected container:
// severity-to-string mapping, constructors for common severities, and a printer
// that renders diagnostics with optional source location context.  Keeping the
// formatting here ensures every subsystem reports errors in a uniform shape.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

#include "support/source_manager.hpp"

namespace ember::support
{
namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

/// @brief Build an error diagnostic with the provided location and message.
Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

/// @brief Build a warning diagnostic with the provided location and message.
Diag makeWarning(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Warning, std::move(msg), loc};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a source manager resolves the location's file the message is
///          prefixed with "<path>:<line>:<column>:" following the common
///          compiler diagnostic style.  Without a resolvable file, a known line
///          is still printed as "line N:" so evaluation traces stay useful for
///          hosts that never registered source files.  The function always
///          emits a trailing newline.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param sm Optional source manager for mapping file identifiers to paths.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    std::string_view path;
    if (sm && diag.loc.isValid())
        path = sm->getPath(diag.loc.file_id);
    if (!path.empty())
    {
        os << path;
        if (diag.loc.hasLine())
        {
            os << ':' << diag.loc.line;
            if (diag.loc.hasColumn())
                os << ':' << diag.loc.column;
        }
        os << ": ";
    }
    else if (diag.loc.hasLine())
    {
        os << "line " << diag.loc.line << ": ";
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}

} // namespace ember::support
