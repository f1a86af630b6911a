//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/Bound.hpp
// Purpose: Declares outlives facts and trait bounds used by where-clauses,
//          node bound contexts and the context store.
// Key invariants: A lifetime-outlives fact leaves `type` default constructed;
//                 a type-outlives fact leaves `longer` default constructed.
// Ownership/Lifetime: Value types.
// Links: docs/tsir-format.md#bounds
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tsir/core/Lifetime.hpp"
#include "tsir/core/Type.hpp"

#include <string>

namespace tsir::core
{

/// @brief Outlives fact `'a: 'b` or `T: 'b`.
struct Outlives
{
    enum class Kind
    {
        Lifetime,
        Type
    };

    Kind kind = Kind::Lifetime;

    /// Longer-lived side of a lifetime fact.
    core::Lifetime longer;

    /// Constrained type of a type-outlives fact.
    core::Type type;

    /// Region that must be outlived.
    core::Lifetime shorter;

    static Outlives lifetimes(core::Lifetime longer, core::Lifetime shorter);
    static Outlives typeOutlives(core::Type type, core::Lifetime shorter);

    /// @brief Check whether @p lt occurs on either side of the fact.
    [[nodiscard]] bool mentions(const core::Lifetime &lt) const;

    std::string toString() const;

    bool operator==(const Outlives &other) const;
    bool operator<(const Outlives &other) const;
};

/// @brief Trait obligation `T: Trait`.
struct TraitBound
{
    core::Type type;
    std::string trait;

    std::string toString() const;

    bool operator==(const TraitBound &other) const;
};

Outlives substitute(const Outlives &fact, const Substitution &subst);
TraitBound substitute(const TraitBound &bound, const Substitution &subst);

} // namespace tsir::core
