//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/DiagSink.hpp
// Purpose: Define diagnostic codes and sinks used by the verifier to report
//          failures and trace notes.
// Key invariants: Sinks receive fully formatted diagnostics; prefixes derived
//                 from VerifyDiagCode are stable and tested.
// Ownership/Lifetime: CollectingDiagSink owns its diagnostics; other sinks are
//                     owned by callers.
// Links: docs/tsir-verifier.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tsir::verify
{

/// @brief Failure taxonomy of the verifier.
enum class VerifyDiagCode
{
    Unknown = 0,          ///< Unclassified diagnostic.
    TypeMismatch,         ///< A type is not a subtype of what a rule requires.
    UseAfterMove,         ///< Read, drop or match of an uninitialized location.
    DoubleInit,           ///< Write into a location that is still initialized.
    DanglingLifetime,     ///< A region is referenced outside the span where it is active.
    ObligationUnproved,   ///< An outlives fact cannot be derived.
    NonExhaustiveSwitch,  ///< Switch arms do not cover the scrutinee type.
    UnresolvedTraitBound, ///< A trait fact or callee lookup failed.
    MalformedContext      ///< Structural problem in a context or declaration.
};

/// @brief Stable diagnostic prefix for @p code, e.g. "verify.use_after_move".
std::string_view toString(VerifyDiagCode code);

tsir::support::Diag makeVerifierDiag(VerifyDiagCode code,
                                     tsir::support::Severity severity,
                                     tsir::support::SourceLoc loc,
                                     std::string message);

tsir::support::Diag makeVerifierError(VerifyDiagCode code,
                                      tsir::support::SourceLoc loc,
                                      std::string message);

/// @brief Note-severity diagnostic used for progress and per-node tracing.
tsir::support::Diag makeTraceNote(tsir::support::SourceLoc loc, std::string message);

class DiagSink
{
  public:
    virtual ~DiagSink() = default;

    /// @brief Report a diagnostic to the sink.
    /// @param diag Diagnostic to forward or store.
    virtual void report(tsir::support::Diag diag) = 0;
};

class CollectingDiagSink : public DiagSink
{
  public:
    /// @brief Append @p diag to the collection.
    /// @param diag Diagnostic to store.
    void report(tsir::support::Diag diag) override;

    /// @brief Access the accumulated diagnostics.
    /// @return Immutable view of the recorded diagnostics.
    [[nodiscard]] const std::vector<tsir::support::Diag> &diagnostics() const;

    /// @brief Remove all stored diagnostics.
    void clear();

  private:
    std::vector<tsir::support::Diag> diags_;
};

} // namespace tsir::verify
