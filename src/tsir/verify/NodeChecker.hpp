//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/NodeChecker.hpp
// Purpose: Entry point of the per-node typing rules.
// Key invariants: A node is checked once against its own declared type and the
//                 declared types of its successors; no result is cached.
// Ownership/Lifetime: Stateless free functions.
// Links: docs/tsir-verifier.md#rules
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tsir/verify/LocationContext.hpp"
#include "tsir/verify/Violation.hpp"

#include <cstddef>

namespace tsir::verify
{

struct VerifyCtx;

/// @brief Check the node at @p index of the function in @p ctx.
/// @details Dispatches on the node kind.  A node whose incoming context holds
///          `!` is unreachable and accepted without further checks.
/// @return Success or the violation raised by the node's rule.
CheckResult checkNode(const VerifyCtx &ctx, size_t index);

/// @brief Check the computed state leaving a node against the return label.
/// @details Parameters and locals must be uninit, the return slot must hold a
///          subtype of the declared return type.
CheckResult checkExitContext(const VerifyCtx &ctx, const LocationContext &out);

} // namespace tsir::verify
