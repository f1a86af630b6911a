//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/CfgVerifier.hpp
// Purpose: Build the label table of one function, check that every declared
//          node type is well formed, then check each node once.
// Key invariants: Checking is a single linear pass over the table in source
//                 order; the first failure aborts the function.
// Ownership/Lifetime: Borrows the function, its scope and the signature map;
//                     owns the label index and the per-label states.
// Links: docs/tsir-verifier.md#cfg
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/options.hpp"
#include "tsir/core/Function.hpp"
#include "tsir/core/TypeContext.hpp"
#include "tsir/verify/LifetimeTracker.hpp"
#include "tsir/verify/LocationContext.hpp"
#include "tsir/verify/TypeRelations.hpp"
#include "tsir/verify/VerifyCtx.hpp"
#include "tsir/verify/Violation.hpp"

#include <map>
#include <vector>

namespace tsir::verify
{

class DiagSink;

class CfgVerifier
{
  public:
    CfgVerifier(const core::Function &fn,
                const core::TypeContext &scope,
                const LocationContext &statics,
                const SignatureMap &signatures,
                const support::Options &options,
                DiagSink *sink);

    /// @brief Index labels and check the structure of every node type.
    /// @details Labels must be unique, `entry` defined, `exit` undefined and
    ///          every successor resolvable.  Each node type must mention
    ///          exactly the function's slots with well-formed types of
    ///          consistent size, list only declared lifetimes including
    ///          'static, and mention no lifetime outside its own active set.
    CheckResult buildTable();

    /// @brief Check every node in table order; requires buildTable().
    CheckResult checkNodes() const;

    /// @brief Declared state of @p label; requires buildTable().
    const NodeState &state(std::string_view label) const;

  private:
    CheckResult checkNodeType(const core::LabeledNode &node,
                              std::map<core::Location, uint64_t> &sizes,
                              NodeState &state) const;
    Violation decorate(Violation v, const core::LabeledNode &node) const;

    const core::Function &fn_;
    const core::TypeContext &scope_;
    const SignatureMap &signatures_;
    const support::Options &options_;
    DiagSink *sink_;

    TypeRelations relations_;
    ContextEngine engine_;
    LifetimeTracker lifetimes_;
    LabelMap labels_;
    std::vector<NodeState> states_;
    NodeState exitState_;
};

} // namespace tsir::verify
