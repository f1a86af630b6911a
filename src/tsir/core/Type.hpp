//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/Type.hpp
// Purpose: Declares the typestate type representation and substitution.
// Key invariants: Kind field determines payload; only Uninit carries a size,
//                 only Param and User carry a name.
// Ownership/Lifetime: Types are values; nested arguments are owned.
// Links: docs/tsir-format.md#types
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tsir/core/Lifetime.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace tsir::core
{

/// @brief Type held by a location at a program point.
/// @details A location's type evolves along the CFG: it starts as
///          `uninit<n>`, becomes a user or parameter type on assignment and
///          returns to `uninit<n>` when moved out or dropped.  The absurd type
///          `!` marks locations on unreachable paths.
struct Type
{
    enum class Kind
    {
        Uninit,
        Absurd,
        Param,
        User
    };

    Kind kind = Kind::Uninit;

    /// Byte size; meaningful only for Uninit.
    uint64_t size = 0;

    /// Parameter or user type name.
    std::string name;

    /// Lifetime arguments of a user type, in declaration order.
    std::vector<Lifetime> lifetimeArgs;

    /// Type arguments of a user type, in declaration order.
    std::vector<Type> typeArgs;

    static Type uninit(uint64_t size);
    static Type absurd();
    static Type param(std::string name);
    static Type user(std::string name,
                     std::vector<Lifetime> lifetimeArgs = {},
                     std::vector<Type> typeArgs = {});

    [[nodiscard]] bool isUninit() const
    {
        return kind == Kind::Uninit;
    }

    [[nodiscard]] bool isAbsurd() const
    {
        return kind == Kind::Absurd;
    }

    /// @brief Check whether @p lt occurs anywhere inside this type.
    [[nodiscard]] bool mentions(const Lifetime &lt) const;

    /// @brief Collect every lifetime occurring in the type.
    void collectLifetimes(std::set<Lifetime> &out) const;

    /// @brief Collect the names of every type parameter occurring in the type.
    void collectParams(std::set<std::string> &out) const;

    /// @brief Render in the textual IR syntax, e.g. `Ref<'a, i32>`.
    std::string toString() const;

    bool operator==(const Type &other) const;
    bool operator!=(const Type &other) const;
    bool operator<(const Type &other) const;
};

/// @brief Mapping from generic parameter names to actual arguments.
struct Substitution
{
    std::map<std::string, Type> types;
    std::map<std::string, Lifetime> lifetimes;
};

/// @brief Apply @p subst to @p lt; unmapped lifetimes are returned unchanged.
Lifetime substitute(const Lifetime &lt, const Substitution &subst);

/// @brief Apply @p subst to every parameter and lifetime inside @p ty.
Type substitute(const Type &ty, const Substitution &subst);

} // namespace tsir::core
