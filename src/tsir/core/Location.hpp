//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/Location.hpp
// Purpose: Declares addressable slots (lvalues) whose type changes over the CFG.
// Key invariants: A location carries no type; types live in contexts.
//                 The return slot has an empty name.
// Ownership/Lifetime: Lightweight value type.
// Links: docs/tsir-format.md#locations
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace tsir::core
{

/// @brief Return slot, static, local or parameter.
struct Location
{
    enum class Kind
    {
        Return,
        Static,
        Local,
        Param
    };

    Kind kind = Kind::Return;
    std::string name;

    static Location returnSlot();
    static Location staticVar(std::string name);
    static Location local(std::string name);
    static Location param(std::string name);

    [[nodiscard]] bool isStatic() const
    {
        return kind == Kind::Static;
    }

    /// @brief Render as `ret`, `@name`, `%name` or `$name`.
    std::string toString() const;

    bool operator==(const Location &other) const;
    bool operator!=(const Location &other) const;
    bool operator<(const Location &other) const;
};

} // namespace tsir::core
