//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/Violation.cpp
// Purpose: Rendering of structured verifier failures.
// Key invariants: Output starts with the diagnostic code prefix followed by
//                 `fn:label: snippet: message`, mirroring instruction diagnostics.
// Links: docs/tsir-verifier.md#diagnostics
//
//===----------------------------------------------------------------------===//

#include "tsir/verify/Violation.hpp"

#include <sstream>
#include <utility>

namespace tsir::verify
{

support::Diag Violation::toDiag() const
{
    std::ostringstream oss;
    if (!function.empty())
    {
        oss << '@' << function;
        if (!label.empty())
            oss << ':' << label;
        if (!snippet.empty())
            oss << ": " << snippet;
        oss << ": ";
    }
    oss << message;
    if (!locations.empty())
    {
        oss << " (at ";
        for (size_t i = 0; i < locations.size(); ++i)
        {
            if (i)
                oss << ", ";
            oss << locations[i].toString();
        }
        oss << ')';
    }
    if (!expected.empty())
        oss << "; expected " << expected;
    if (!actual.empty())
        oss << "; actual " << actual;
    return makeVerifierError(code, loc, oss.str());
}

Violation makeViolation(VerifyDiagCode code,
                        std::string message,
                        std::vector<core::Location> locations)
{
    Violation v;
    v.code = code;
    v.message = std::move(message);
    v.locations = std::move(locations);
    return v;
}

} // namespace tsir::verify
