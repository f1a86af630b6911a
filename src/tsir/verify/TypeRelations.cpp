//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/TypeRelations.cpp
// Purpose: Implement the subtyping lattice used by context comparison and
//          switch narrowing.
// Key invariants: The variant chain of a declaration is acyclic because a
//                 variant may only name an earlier declaration as parent.
// Links: docs/tsir-verifier.md#subtyping
//
//===----------------------------------------------------------------------===//

#include "tsir/verify/TypeRelations.hpp"

namespace tsir::verify
{

using core::Type;

bool TypeRelations::isSubtype(const Type &sub, const Type &super) const
{
    if (sub.isAbsurd() || sub == super)
        return true;
    if (sub.kind != Type::Kind::User || super.kind != Type::Kind::User)
        return false;
    if (sub.lifetimeArgs != super.lifetimeArgs || sub.typeArgs != super.typeArgs)
        return false;

    const core::UserTypeDecl *decl = types_.findUserType(sub.name);
    while (decl && decl->parent)
    {
        if (*decl->parent == super.name)
            return true;
        decl = types_.findUserType(*decl->parent);
    }
    return false;
}

Type TypeRelations::meet(const Type &a, const Type &b) const
{
    if (isSubtype(a, b))
        return a;
    if (isSubtype(b, a))
        return b;
    return Type::absurd();
}

bool TypeRelations::covers(const std::vector<Type> &arms, const Type &type) const
{
    if (type.isAbsurd())
        return true;
    for (const auto &arm : arms)
    {
        if (isSubtype(type, arm))
            return true;
    }
    if (type.kind != Type::Kind::User)
        return false;

    const auto variants = types_.variantsOf(type.name);
    if (variants.empty())
        return false;
    for (const auto *variant : variants)
    {
        const Type instance = Type::user(variant->name, type.lifetimeArgs, type.typeArgs);
        if (!covers(arms, instance))
            return false;
    }
    return true;
}

} // namespace tsir::verify
