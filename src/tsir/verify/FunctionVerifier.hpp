//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/FunctionVerifier.hpp
// Purpose: Verify one function: scope its generic parameters, check its
//          signature and entry shape, and run the CFG verifier.
// Key invariants: Each function is checked in a fresh child scope of the
//                 program store; the program store is never modified.
// Ownership/Lifetime: Borrows the program-wide store, statics and signatures.
// Links: docs/tsir-verifier.md#functions
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/options.hpp"
#include "tsir/core/Function.hpp"
#include "tsir/core/TypeContext.hpp"
#include "tsir/verify/LocationContext.hpp"
#include "tsir/verify/VerifyCtx.hpp"
#include "tsir/verify/Violation.hpp"

#include <string>
#include <vector>

namespace tsir::verify
{

class CfgVerifier;
class DiagSink;

/// @brief Accepted typing of a function, universally quantified over its
///        generic parameters.
struct Judgment
{
    std::string function;
    core::Generics generics;
    std::vector<core::Type> params;
    core::Type ret;

    /// @brief Render as `forall<'a, T> where T: 'a . fn @f(T) -> T`.
    std::string toString() const;
};

class FunctionVerifier
{
  public:
    FunctionVerifier(const core::TypeContext &types,
                     const LocationContext &statics,
                     const SignatureMap &signatures,
                     const support::Options &options,
                     DiagSink *sink);

    /// @brief Verify @p fn and produce its judgment.
    /// @return Judgment on success or the first violation found.
    VResult<Judgment> verify(const core::Function &fn) const;

  private:
    CheckResult checkSignature(const core::Function &fn, const core::TypeContext &scope) const;
    CheckResult checkEntry(const core::Function &fn,
                           const core::TypeContext &scope,
                           const CfgVerifier &cfg) const;

    const core::TypeContext &types_;
    const LocationContext &statics_;
    const SignatureMap &signatures_;
    const support::Options &options_;
    DiagSink *sink_;
};

/// @brief Populate @p scope with the generic parameters and where-clause
///        trait postulates of @p generics.
void addGenericsToScope(const core::Generics &generics, core::TypeContext &scope);

} // namespace tsir::verify
