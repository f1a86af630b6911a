//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/Lifetime.hpp
// Purpose: Declares the region names tracked by the lifetime analysis.
// Key invariants: Named lifetimes carry a non-empty name; 'static and the
//                 impl-fact wildcard '_ carry none.
// Ownership/Lifetime: Lightweight value type.
// Links: docs/tsir-format.md#lifetimes
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace tsir::core
{

/// @brief Region name: the static lifetime or a function-local/parameter one.
struct Lifetime
{
    enum class Kind
    {
        Static,
        Named,
        /// Matches any lifetime; only legal inside impl facts.
        Wildcard
    };

    Kind kind = Kind::Static;

    /// Name without the leading quote; empty unless kind == Named.
    std::string name;

    static Lifetime staticLifetime();
    static Lifetime named(std::string name);
    static Lifetime wildcard();

    [[nodiscard]] bool isStatic() const
    {
        return kind == Kind::Static;
    }

    /// @brief Render as `'static`, `'name` or `'_`.
    std::string toString() const;

    bool operator==(const Lifetime &other) const;
    bool operator!=(const Lifetime &other) const;
    bool operator<(const Lifetime &other) const;
};

} // namespace tsir::core
