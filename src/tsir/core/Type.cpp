//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/Type.cpp
// Purpose: Factories, structural queries, printing and substitution for types.
// Key invariants: Structural equality compares every payload field.
// Ownership/Lifetime: Pure value operations; no shared state.
// Links: docs/tsir-format.md#types
//
//===----------------------------------------------------------------------===//

#include "tsir/core/Type.hpp"

#include <sstream>
#include <tuple>
#include <utility>

namespace tsir::core
{

Type Type::uninit(uint64_t size)
{
    Type t;
    t.kind = Kind::Uninit;
    t.size = size;
    return t;
}

Type Type::absurd()
{
    Type t;
    t.kind = Kind::Absurd;
    return t;
}

Type Type::param(std::string name)
{
    Type t;
    t.kind = Kind::Param;
    t.name = std::move(name);
    return t;
}

Type Type::user(std::string name, std::vector<Lifetime> lifetimeArgs, std::vector<Type> typeArgs)
{
    Type t;
    t.kind = Kind::User;
    t.name = std::move(name);
    t.lifetimeArgs = std::move(lifetimeArgs);
    t.typeArgs = std::move(typeArgs);
    return t;
}

bool Type::mentions(const Lifetime &lt) const
{
    for (const auto &arg : lifetimeArgs)
    {
        if (arg == lt)
            return true;
    }
    for (const auto &arg : typeArgs)
    {
        if (arg.mentions(lt))
            return true;
    }
    return false;
}

void Type::collectLifetimes(std::set<Lifetime> &out) const
{
    out.insert(lifetimeArgs.begin(), lifetimeArgs.end());
    for (const auto &arg : typeArgs)
        arg.collectLifetimes(out);
}

void Type::collectParams(std::set<std::string> &out) const
{
    if (kind == Kind::Param)
    {
        out.insert(name);
        return;
    }
    for (const auto &arg : typeArgs)
        arg.collectParams(out);
}

std::string Type::toString() const
{
    switch (kind)
    {
        case Kind::Uninit:
            return "uninit<" + std::to_string(size) + ">";
        case Kind::Absurd:
            return "!";
        case Kind::Param:
            return name;
        case Kind::User:
            break;
    }

    if (lifetimeArgs.empty() && typeArgs.empty())
        return name;

    std::ostringstream os;
    os << name << '<';
    bool first = true;
    for (const auto &lt : lifetimeArgs)
    {
        if (!first)
            os << ", ";
        first = false;
        os << lt.toString();
    }
    for (const auto &arg : typeArgs)
    {
        if (!first)
            os << ", ";
        first = false;
        os << arg.toString();
    }
    os << '>';
    return os.str();
}

bool Type::operator==(const Type &other) const
{
    return kind == other.kind && size == other.size && name == other.name &&
           lifetimeArgs == other.lifetimeArgs && typeArgs == other.typeArgs;
}

bool Type::operator!=(const Type &other) const
{
    return !(*this == other);
}

bool Type::operator<(const Type &other) const
{
    return std::tie(kind, size, name, lifetimeArgs, typeArgs) <
           std::tie(other.kind, other.size, other.name, other.lifetimeArgs, other.typeArgs);
}

Lifetime substitute(const Lifetime &lt, const Substitution &subst)
{
    if (lt.kind != Lifetime::Kind::Named)
        return lt;
    auto it = subst.lifetimes.find(lt.name);
    return it == subst.lifetimes.end() ? lt : it->second;
}

Type substitute(const Type &ty, const Substitution &subst)
{
    switch (ty.kind)
    {
        case Type::Kind::Uninit:
        case Type::Kind::Absurd:
            return ty;
        case Type::Kind::Param:
        {
            auto it = subst.types.find(ty.name);
            return it == subst.types.end() ? ty : it->second;
        }
        case Type::Kind::User:
            break;
    }

    Type out = ty;
    for (auto &lt : out.lifetimeArgs)
        lt = substitute(lt, subst);
    for (auto &arg : out.typeArgs)
        arg = substitute(arg, subst);
    return out;
}

} // namespace tsir::core
