//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Diagnostic record shared by the parser, verifier and tsir-verify,
//          and the engine the CLI uses to print violations with a summary.
// Key invariants: errorCount() equals the number of Error-severity reports.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: docs/tsir-verifier.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace tsir::support
{

class SourceManager;

/// @brief Severity of a diagnostic; trace output uses Note.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief One parse error, violation or trace note.
struct Diagnostic
{
    Severity severity;   ///< Error for violations and parse failures
    std::string message; ///< `verify.*` or `line N:` text
    SourceLoc loc;       ///< Node or line position; invalid when unknown
};

/// @brief Collects the violations of one verifier run in program order.
class DiagnosticEngine
{
  public:
    void report(Diagnostic d);

    /// @brief Print every diagnostic as `path:line:col: severity: message`.
    /// @param sm Resolves file ids to paths; positions are omitted without it.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    /// @brief Number of Error diagnostics, printed by tsir-verify as a summary.
    size_t errorCount() const;

    /// @brief Diagnostics in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
};

} // namespace tsir::support
