//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic engine responsible for collecting messages.  The
// engine aggregates messages emitted by the parser and the verifier and keeps
// track of severity counts.  Diagnostics are stored until callers explicitly
// print or inspect them.
//
//===----------------------------------------------------------------------===//

#include "support/diagnostics.hpp"

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

namespace tsir::support
{

/// @brief Adds a diagnostic to the engine and updates severity counters.
///
/// Notes and warnings leave the error counter unchanged.
///
/// @param d Diagnostic to record; moved into the engine's storage.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    diags_.push_back(std::move(d));
}

/// @brief Writes all stored diagnostics to the provided output stream.
///
/// @param os Output stream that receives the formatted diagnostics.
/// @param sm Optional source manager used to translate file identifiers.
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
        printDiag(d, os, sm);
}

/// @brief Returns the number of error-severity diagnostics recorded so far.
size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

} // namespace tsir::support
