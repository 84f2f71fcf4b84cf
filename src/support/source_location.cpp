//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the out-of-line validity query for the SourceLoc value type.  A
// location is considered valid when it refers to a registered file identifier;
// line and column components are optional and surfaced through `hasLine()` and
// `hasColumn()` respectively.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace ember::support
{

/// @brief Determine whether the location carries a real source attachment.
///
/// @details SourceManager dispenses monotonically increasing identifiers for
///          every file it tracks.  The default-constructed location uses zero
///          to mark "unknown", which is how synthesized IR statements appear.
///
/// @return True when the location originated from a tracked source file.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

} // namespace ember::support
