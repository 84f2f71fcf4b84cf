//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// The diagnostic engine aggregates messages emitted while evaluating IR and
// keeps track of severity counts.  Diagnostics are stored until callers
// explicitly print or inspect them.
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace ember::support
{

/// @brief Adds a diagnostic to the engine and updates severity counters.
///
/// Notes are stored but not counted.
///
/// @param d Diagnostic to record; moved into the engine's storage.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/// @brief Writes all stored diagnostics to the provided output stream.
///
/// Formatting is delegated to `printDiag` so a single diagnostic and a batch
/// render identically.
///
/// @param os Output stream that receives the formatted diagnostics.
/// @param sm Optional source manager used to translate file identifiers.
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

/// @brief Returns the number of error-severity diagnostics recorded so far.
size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

/// @brief Returns the number of warning-severity diagnostics recorded so far.
size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

} // namespace ember::support
