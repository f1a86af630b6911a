//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/Verifier.hpp
// Purpose: Program-level verifier entry points.
// Key invariants: Failures are isolated per function; a rejected function
//                 never prevents the others from being checked.
// Ownership/Lifetime: Stateless; results are returned by value.
// Links: docs/tsir-verifier.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/options.hpp"
#include "tsir/verify/FunctionVerifier.hpp"
#include "tsir/verify/Violation.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tsir::core
{
struct Program;
}

namespace tsir::verify
{

class DiagSink;

/// @brief Outcome of one function.
struct FunctionResult
{
    std::string function;
    std::optional<Judgment> judgment;
    std::optional<Violation> violation;

    [[nodiscard]] bool ok() const
    {
        return judgment.has_value();
    }
};

/// @brief Outcome of a whole program.
struct VerifyReport
{
    /// Failure of program-wide declarations; when set no function was checked.
    std::optional<Violation> programError;

    /// One entry per function, in program order.
    std::vector<FunctionResult> functions;

    [[nodiscard]] bool ok() const;

    /// @brief Every violation in report order.
    std::vector<Violation> violations() const;
};

class Verifier
{
  public:
    /// @brief Verify @p program and report every function's outcome.
    /// @param program Program to verify.
    /// @param options Trace and worker-count settings.
    /// @param sink Optional sink receiving trace notes.
    /// @throws std::system_error when a worker thread cannot be started.
    static VerifyReport run(const core::Program &program,
                            const support::Options &options = {},
                            DiagSink *sink = nullptr);

    /// @brief Verify @p program, stopping at the first failure in program order.
    /// @return Expected success or diagnostic on failure.
    [[nodiscard]] static tsir::support::Expected<void> verify(const core::Program &program);
};

} // namespace tsir::verify
