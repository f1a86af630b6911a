//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/Bound.cpp
// Purpose: Construction, printing and substitution of outlives and trait bounds.
// Links: docs/tsir-format.md#bounds
//
//===----------------------------------------------------------------------===//

#include "tsir/core/Bound.hpp"

#include <tuple>
#include <utility>

namespace tsir::core
{

Outlives Outlives::lifetimes(core::Lifetime longer, core::Lifetime shorter)
{
    Outlives fact;
    fact.kind = Kind::Lifetime;
    fact.longer = std::move(longer);
    fact.shorter = std::move(shorter);
    return fact;
}

Outlives Outlives::typeOutlives(core::Type type, core::Lifetime shorter)
{
    Outlives fact;
    fact.kind = Kind::Type;
    fact.type = std::move(type);
    fact.shorter = std::move(shorter);
    return fact;
}

bool Outlives::mentions(const core::Lifetime &lt) const
{
    if (shorter == lt)
        return true;
    if (kind == Kind::Lifetime)
        return longer == lt;
    return type.mentions(lt);
}

std::string Outlives::toString() const
{
    const std::string lhs = kind == Kind::Lifetime ? longer.toString() : type.toString();
    return lhs + ": " + shorter.toString();
}

bool Outlives::operator==(const Outlives &other) const
{
    return kind == other.kind && longer == other.longer && type == other.type &&
           shorter == other.shorter;
}

bool Outlives::operator<(const Outlives &other) const
{
    return std::tie(kind, longer, type, shorter) <
           std::tie(other.kind, other.longer, other.type, other.shorter);
}

std::string TraitBound::toString() const
{
    return type.toString() + ": " + trait;
}

bool TraitBound::operator==(const TraitBound &other) const
{
    return type == other.type && trait == other.trait;
}

Outlives substitute(const Outlives &fact, const Substitution &subst)
{
    Outlives out = fact;
    out.shorter = substitute(fact.shorter, subst);
    if (fact.kind == Outlives::Kind::Lifetime)
        out.longer = substitute(fact.longer, subst);
    else
        out.type = substitute(fact.type, subst);
    return out;
}

TraitBound substitute(const TraitBound &bound, const Substitution &subst)
{
    return TraitBound{substitute(bound.type, subst), bound.trait};
}

} // namespace tsir::core
