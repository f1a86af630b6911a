//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/DiagSink.cpp
// Purpose: Implement verifier diagnostic helpers and the collecting sink.
// Key invariants: Prefixes are only prepended for known diagnostic codes.
// Ownership/Lifetime: CollectingDiagSink stores diagnostics by value.
// Links: docs/tsir-verifier.md
//
//===----------------------------------------------------------------------===//

#include "tsir/verify/DiagSink.hpp"

#include <utility>

namespace
{
std::string_view diagCodeToPrefix(tsir::verify::VerifyDiagCode code)
{
    using tsir::verify::VerifyDiagCode;
    switch (code)
    {
        case VerifyDiagCode::Unknown:
            return {};
        case VerifyDiagCode::TypeMismatch:
            return "verify.type_mismatch";
        case VerifyDiagCode::UseAfterMove:
            return "verify.use_after_move";
        case VerifyDiagCode::DoubleInit:
            return "verify.double_init";
        case VerifyDiagCode::DanglingLifetime:
            return "verify.dangling_lifetime";
        case VerifyDiagCode::ObligationUnproved:
            return "verify.obligation_unproved";
        case VerifyDiagCode::NonExhaustiveSwitch:
            return "verify.non_exhaustive_switch";
        case VerifyDiagCode::UnresolvedTraitBound:
            return "verify.unresolved_trait_bound";
        case VerifyDiagCode::MalformedContext:
            return "verify.malformed_context";
    }
    return {};
}
} // namespace

namespace tsir::verify
{

std::string_view toString(VerifyDiagCode code)
{
    return diagCodeToPrefix(code);
}

tsir::support::Diag makeVerifierDiag(VerifyDiagCode code,
                                     tsir::support::Severity severity,
                                     tsir::support::SourceLoc loc,
                                     std::string message)
{
    const std::string_view prefix = diagCodeToPrefix(code);
    if (!prefix.empty())
    {
        if (!message.empty())
        {
            message.insert(0, ": ");
            message.insert(0, prefix);
        }
        else
        {
            message.assign(prefix);
        }
    }
    return {severity, std::move(message), loc};
}

tsir::support::Diag makeVerifierError(VerifyDiagCode code,
                                      tsir::support::SourceLoc loc,
                                      std::string message)
{
    return makeVerifierDiag(code, tsir::support::Severity::Error, loc, std::move(message));
}

tsir::support::Diag makeTraceNote(tsir::support::SourceLoc loc, std::string message)
{
    return makeVerifierDiag(
        VerifyDiagCode::Unknown, tsir::support::Severity::Note, loc, std::move(message));
}

void CollectingDiagSink::report(tsir::support::Diag diag)
{
    diags_.push_back(std::move(diag));
}

const std::vector<tsir::support::Diag> &CollectingDiagSink::diagnostics() const
{
    return diags_;
}

void CollectingDiagSink::clear()
{
    diags_.clear();
}

} // namespace tsir::verify
