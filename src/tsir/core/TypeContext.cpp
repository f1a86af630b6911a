//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/TypeContext.cpp
// Purpose: Lookup, trait fact resolution, sizing and validation for the
//          context store.
// Key invariants: Lookups search this scope first, then the parent chain.
//                 Ordering checks consider only earlier declarations of the
//                 current scope plus the complete parent.
// Ownership/Lifetime: The parent pointer is borrowed and must outlive this scope.
// Links: docs/tsir-format.md#declarations
//
//===----------------------------------------------------------------------===//

#include "tsir/core/TypeContext.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace tsir::core
{
namespace
{
using support::Expected;
using support::makeError;

/// Structural match of an impl fact pattern against a concrete type.
bool matchesFact(const Type &pattern, const Type &actual)
{
    if (pattern.kind != actual.kind)
        return false;
    switch (pattern.kind)
    {
        case Type::Kind::Uninit:
            return pattern.size == actual.size;
        case Type::Kind::Absurd:
            return true;
        case Type::Kind::Param:
            return pattern.name == actual.name;
        case Type::Kind::User:
            break;
    }
    if (pattern.name != actual.name || pattern.lifetimeArgs.size() != actual.lifetimeArgs.size() ||
        pattern.typeArgs.size() != actual.typeArgs.size())
        return false;
    for (size_t i = 0; i < pattern.lifetimeArgs.size(); ++i)
    {
        const Lifetime &lt = pattern.lifetimeArgs[i];
        if (lt.kind != Lifetime::Kind::Wildcard && lt != actual.lifetimeArgs[i])
            return false;
    }
    for (size_t i = 0; i < pattern.typeArgs.size(); ++i)
    {
        if (!matchesFact(pattern.typeArgs[i], actual.typeArgs[i]))
            return false;
    }
    return true;
}

bool hasDuplicates(const std::vector<std::string> &names)
{
    std::set<std::string> seen;
    for (const auto &n : names)
    {
        if (!seen.insert(n).second)
            return true;
    }
    return false;
}
} // namespace

TypeContext::TypeContext(const TypeContext *parent) : parent_(parent) {}

void TypeContext::addUserType(UserTypeDecl decl)
{
    decls_.emplace_back(std::move(decl));
}

void TypeContext::addTypeParam(TypeParam param)
{
    decls_.emplace_back(std::move(param));
}

void TypeContext::addLifetime(LifetimeDecl decl)
{
    decls_.emplace_back(std::move(decl));
}

void TypeContext::addImpl(ImplFact fact)
{
    decls_.emplace_back(std::move(fact));
}

void TypeContext::addPostulate(TraitBound bound)
{
    decls_.emplace_back(std::move(bound));
}

void TypeContext::addPrimOp(PrimOpDecl decl)
{
    decls_.emplace_back(std::move(decl));
}

template <class T, class Pred> const T *TypeContext::find(Pred pred, size_t limit) const
{
    const size_t end = std::min(limit, decls_.size());
    for (size_t i = 0; i < end; ++i)
    {
        if (const auto *decl = std::get_if<T>(&decls_[i]); decl && pred(*decl))
            return decl;
    }
    return parent_ ? parent_->find<T>(pred, kAll) : nullptr;
}

const UserTypeDecl *TypeContext::findUserTypeBefore(std::string_view name, size_t limit) const
{
    return find<UserTypeDecl>([&](const UserTypeDecl &d) { return d.name == name; }, limit);
}

const TypeParam *TypeContext::findTypeParamBefore(std::string_view name, size_t limit) const
{
    return find<TypeParam>([&](const TypeParam &p) { return p.name == name; }, limit);
}

bool TypeContext::hasLifetimeBefore(const Lifetime &lt, size_t limit) const
{
    if (lt.isStatic())
        return true;
    if (lt.kind != Lifetime::Kind::Named)
        return false;
    return find<LifetimeDecl>([&](const LifetimeDecl &d) { return d.lifetime == lt; }, limit) !=
           nullptr;
}

const UserTypeDecl *TypeContext::findUserType(std::string_view name) const
{
    return findUserTypeBefore(name, kAll);
}

const TypeParam *TypeContext::findTypeParam(std::string_view name) const
{
    return findTypeParamBefore(name, kAll);
}

const LifetimeDecl *TypeContext::findLifetime(const Lifetime &lt) const
{
    return find<LifetimeDecl>([&](const LifetimeDecl &d) { return d.lifetime == lt; }, kAll);
}

const PrimOpDecl *TypeContext::findPrimOp(std::string_view name) const
{
    return find<PrimOpDecl>([&](const PrimOpDecl &d) { return d.name == name; }, kAll);
}

bool TypeContext::hasLifetime(const Lifetime &lt) const
{
    return hasLifetimeBefore(lt, kAll);
}

std::vector<const UserTypeDecl *> TypeContext::variantsOf(std::string_view name) const
{
    std::vector<const UserTypeDecl *> out;
    for (const TypeContext *scope = this; scope; scope = scope->parent_)
    {
        for (const auto &decl : scope->decls_)
        {
            if (const auto *ut = std::get_if<UserTypeDecl>(&decl); ut && ut->parent &&
                                                                   *ut->parent == name)
                out.push_back(ut);
        }
    }
    return out;
}

bool TypeContext::holds(const Type &type, std::string_view trait) const
{
    if (type.isAbsurd())
        return true;
    for (const TypeContext *scope = this; scope; scope = scope->parent_)
    {
        for (const auto &decl : scope->decls_)
        {
            if (const auto *fact = std::get_if<ImplFact>(&decl))
            {
                if (fact->trait == trait && matchesFact(fact->type, type))
                    return true;
            }
            else if (const auto *bound = std::get_if<TraitBound>(&decl))
            {
                if (bound->trait == trait && bound->type == type)
                    return true;
            }
        }
    }
    return false;
}

std::optional<uint64_t> TypeContext::sizeOf(const Type &type) const
{
    switch (type.kind)
    {
        case Type::Kind::Uninit:
            return type.size;
        case Type::Kind::Absurd:
            return std::nullopt;
        case Type::Kind::Param:
            if (const auto *p = findTypeParam(type.name))
                return p->size;
            return std::nullopt;
        case Type::Kind::User:
            if (const auto *d = findUserType(type.name))
                return d->size;
            return std::nullopt;
    }
    return std::nullopt;
}

Expected<void> TypeContext::checkWellFormed(const Type &type) const
{
    return checkType(type, kAll, false);
}

Expected<void> TypeContext::checkType(const Type &type, size_t limit, bool allowWildcard) const
{
    switch (type.kind)
    {
        case Type::Kind::Uninit:
        case Type::Kind::Absurd:
            return {};
        case Type::Kind::Param:
            if (!findTypeParamBefore(type.name, limit))
                return Expected<void>{makeError({}, "unknown type parameter '" + type.name + "'")};
            return {};
        case Type::Kind::User:
            break;
    }

    const UserTypeDecl *decl = findUserTypeBefore(type.name, limit);
    if (!decl)
        return Expected<void>{makeError({}, "unknown type '" + type.name + "'")};
    if (decl->lifetimeParams.size() != type.lifetimeArgs.size() ||
        decl->typeParams.size() != type.typeArgs.size())
    {
        return Expected<void>{makeError({},
                                        "type '" + type.toString() + "' expects " +
                                            std::to_string(decl->lifetimeParams.size()) +
                                            " lifetime and " +
                                            std::to_string(decl->typeParams.size()) +
                                            " type arguments")};
    }
    for (const auto &lt : type.lifetimeArgs)
    {
        if (lt.kind == Lifetime::Kind::Wildcard)
        {
            if (!allowWildcard)
                return Expected<void>{makeError(
                    {}, "wildcard lifetime outside impl fact in '" + type.toString() + "'")};
            continue;
        }
        if (!hasLifetimeBefore(lt, limit))
            return Expected<void>{makeError({}, "undeclared lifetime " + lt.toString())};
    }
    for (const auto &arg : type.typeArgs)
    {
        if (auto result = checkType(arg, limit, allowWildcard); !result)
            return result;
    }
    return {};
}

Expected<void> TypeContext::validateDecl(const Decl &decl, size_t index) const
{
    auto nameTaken = [&](const std::string &name)
    { return findUserTypeBefore(name, index) || findTypeParamBefore(name, index); };

    return std::visit(
        Overload{
            [&](const UserTypeDecl &d) -> Expected<void>
            {
                if (nameTaken(d.name))
                    return Expected<void>{makeError(d.loc, "duplicate type '" + d.name + "'")};
                if (hasDuplicates(d.lifetimeParams) || hasDuplicates(d.typeParams))
                    return Expected<void>{
                        makeError(d.loc, "duplicate generic parameter in '" + d.name + "'")};
                if (!d.parent)
                    return {};
                const UserTypeDecl *parent = findUserTypeBefore(*d.parent, index);
                if (!parent)
                    return Expected<void>{makeError(
                        d.loc, "variant '" + d.name + "' of undeclared type '" + *d.parent + "'")};
                if (parent->lifetimeParams.size() != d.lifetimeParams.size() ||
                    parent->typeParams.size() != d.typeParams.size())
                    return Expected<void>{makeError(d.loc,
                                                    "variant '" + d.name +
                                                        "' arity differs from '" + parent->name +
                                                        "'")};
                if (parent->size != d.size)
                    return Expected<void>{makeError(d.loc,
                                                    "variant '" + d.name + "' size differs from '" +
                                                        parent->name + "'")};
                return {};
            },
            [&](const TypeParam &p) -> Expected<void>
            {
                if (nameTaken(p.name))
                    return Expected<void>{makeError({}, "duplicate type '" + p.name + "'")};
                return {};
            },
            [&](const LifetimeDecl &d) -> Expected<void>
            {
                if (d.lifetime.kind != Lifetime::Kind::Named)
                    return Expected<void>{
                        makeError({}, "cannot declare lifetime " + d.lifetime.toString())};
                if (hasLifetimeBefore(d.lifetime, index))
                    return Expected<void>{
                        makeError({}, "duplicate lifetime " + d.lifetime.toString())};
                return {};
            },
            [&](const ImplFact &f) -> Expected<void>
            {
                if (auto result = checkType(f.type, index, true); !result)
                    return Expected<void>{makeError(
                        f.loc, "impl " + f.trait + " for " + f.type.toString() + ": " +
                                   result.error().message)};
                return {};
            },
            [&](const TraitBound &b) -> Expected<void>
            {
                if (auto result = checkType(b.type, index, false); !result)
                    return Expected<void>{
                        makeError({}, "bound " + b.toString() + ": " + result.error().message)};
                return {};
            },
            [&](const PrimOpDecl &d) -> Expected<void>
            {
                if (find<PrimOpDecl>([&](const PrimOpDecl &o) { return o.name == d.name; }, index))
                    return Expected<void>{makeError(d.loc, "duplicate primop '" + d.name + "'")};
                if (d.params.empty() || d.params.size() > 2)
                    return Expected<void>{
                        makeError(d.loc, "primop '" + d.name + "' must take one or two operands")};
                for (const auto &ty : d.params)
                {
                    if (auto result = checkType(ty, index, false); !result)
                        return Expected<void>{
                            makeError(d.loc, "primop '" + d.name + "': " + result.error().message)};
                }
                if (auto result = checkType(d.result, index, false); !result)
                    return Expected<void>{
                        makeError(d.loc, "primop '" + d.name + "': " + result.error().message)};
                return {};
            }},
        decl);
}

Expected<void> TypeContext::validate() const
{
    for (size_t i = 0; i < decls_.size(); ++i)
    {
        if (auto result = validateDecl(decls_[i], i); !result)
            return result;
    }
    return {};
}

Type TypeContext::conditionType() const
{
    return Type::user("bool");
}

} // namespace tsir::core
