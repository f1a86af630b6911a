//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/Violation.hpp
// Purpose: Structured verifier failure and the result aliases used by every
//          checking routine.
// Key invariants: `code` is never Unknown for a reported violation.  Engine
//                 routines fill code, message and offending locations; the
//                 CFG verifier adds function, label, rule and contexts.
// Ownership/Lifetime: Value type.
// Links: docs/tsir-verifier.md#diagnostics
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "tsir/core/Location.hpp"
#include "tsir/verify/DiagSink.hpp"

#include <string>
#include <vector>

namespace tsir::verify
{

/// @brief Reason a function, or the program around it, was rejected.
struct Violation
{
    VerifyDiagCode code = VerifyDiagCode::Unknown;
    std::string message;

    /// Function name; empty for program-level failures.
    std::string function;

    /// Label of the failing node; empty when not tied to a node.
    std::string label;

    /// Rule name of the failing node kind (e.g. "assign").
    std::string rule;

    /// Rendered node text.
    std::string snippet;

    /// Required context, when a context comparison failed.
    std::string expected;

    /// Computed context at the failing point.
    std::string actual;

    std::vector<core::Location> locations;
    support::SourceLoc loc{};

    /// @brief Format as a single-line error diagnostic.
    support::Diag toDiag() const;
};

using CheckResult = support::Expected<void, Violation>;
template <class T> using VResult = support::Expected<T, Violation>;

/// @brief Build a violation carrying only a code, message and locations.
Violation makeViolation(VerifyDiagCode code,
                        std::string message,
                        std::vector<core::Location> locations = {});

} // namespace tsir::verify
