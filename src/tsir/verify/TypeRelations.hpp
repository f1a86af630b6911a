//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/TypeRelations.hpp
// Purpose: Subtyping, meet and coverage over typestate types.
// Key invariants: Subtyping is reflexive and transitive; `!` is the bottom
//                 element; generic arguments are invariant.
// Ownership/Lifetime: Borrows the context store for the lifetime of the object.
// Links: docs/tsir-verifier.md#subtyping
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tsir/core/Type.hpp"
#include "tsir/core/TypeContext.hpp"

#include <vector>

namespace tsir::verify
{

class TypeRelations
{
  public:
    explicit TypeRelations(const core::TypeContext &types) : types_(types) {}

    /// @brief Decide `sub <: super`.
    /// @details Holds when the types are equal, when @p sub is `!`, or when
    ///          @p sub is a variant (transitively) of @p super's enum applied
    ///          to identical arguments.  `uninit<n> <: uninit<m>` iff n == m.
    [[nodiscard]] bool isSubtype(const core::Type &sub, const core::Type &super) const;

    /// @brief Greatest lower bound of @p a and @p b; `!` when disjoint.
    core::Type meet(const core::Type &a, const core::Type &b) const;

    /// @brief Check that every value of @p type is matched by some arm.
    [[nodiscard]] bool covers(const std::vector<core::Type> &arms, const core::Type &type) const;

    const core::TypeContext &types() const
    {
        return types_;
    }

  private:
    const core::TypeContext &types_;
};

} // namespace tsir::verify
