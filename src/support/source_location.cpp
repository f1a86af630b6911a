//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the out-of-line validity query for the SourceLoc value type.  A
// location is valid when it refers to a registered file identifier; line and
// column components are optional and surfaced through `hasLine()` and
// `hasColumn()`.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace tsir::support
{

/// @brief Determine whether the location carries a real source attachment.
///
/// @details SourceManager dispenses monotonically increasing identifiers for
///          every registered file.  The default-constructed location uses zero
///          to mark "unknown", which lets diagnostics elide missing information
///          for IR built programmatically.
///
/// @return True when the location originated from a tracked source file.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

} // namespace tsir::support
