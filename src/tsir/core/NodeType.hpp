//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/NodeType.hpp
// Purpose: Declares the typing precondition attached to every CFG label.
// Key invariants: Bindings mention every parameter, local and the return
//                 slot of the owning function exactly once; statics are never
//                 listed.  These are checked by the verifier, not enforced here.
// Ownership/Lifetime: Owned by the LabeledNode that declares it.
// Links: docs/tsir-format.md#node-types
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tsir/core/Bound.hpp"
#include "tsir/core/Location.hpp"
#include "tsir/core/Type.hpp"

#include <string>
#include <vector>

namespace tsir::core
{

/// @brief Declared type of one location inside a node type.
struct LocationBinding
{
    Location loc;
    Type type;
};

/// @brief (LocationContext; LifetimeContext; BoundContext) required on entry
///        to a label.
struct NodeType
{
    /// Location bindings in source order; duplicates are rejected later.
    std::vector<LocationBinding> locations;

    /// Lifetimes active at the label.
    std::vector<Lifetime> lifetimes;

    /// Outlives facts that may be assumed at the label.
    std::vector<Outlives> bounds;

    /// @brief Render as `[$x: T, ret: uninit<8>; 'static; T: 'static]`.
    std::string toString() const;
};

} // namespace tsir::core
