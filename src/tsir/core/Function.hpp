//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Function struct together with its signature and
// generic parameter list.  A function body is an index-addressed label table:
// each LabeledNode pairs a unique label with the NodeType required on entry
// and the node executed there.
//
// Key Invariants:
// - The label `entry` is defined exactly once
// - The label `exit` is never defined; nodes reference it to return
// - Every NodeType mentions each parameter, local and the return slot
//
// Ownership Model:
// - Program owns Functions by value
// - Function owns its parameters, locals and label table
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include "tsir/core/Bound.hpp"
#include "tsir/core/Location.hpp"
#include "tsir/core/Node.hpp"
#include "tsir/core/NodeType.hpp"
#include "tsir/core/Type.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tsir::core
{

inline constexpr std::string_view kEntryLabel = "entry";
inline constexpr std::string_view kExitLabel = "exit";

/// @brief Generic type parameter with the fixed byte size of any instance.
struct TypeParam
{
    std::string name;
    uint64_t size = 0;
};

/// @brief Generic parameters and where-clause of a function signature.
struct Generics
{
    std::vector<Lifetime> lifetimes;
    std::vector<TypeParam> types;

    /// Trait obligations from the where-clause.
    std::vector<TraitBound> traitBounds;

    /// Outlives obligations from the where-clause.
    std::vector<Outlives> outlives;

    [[nodiscard]] bool empty() const
    {
        return lifetimes.empty() && types.empty() && traitBounds.empty() && outlives.empty();
    }
};

/// @brief Formal parameter slot and its declared type.
struct Param
{
    Location loc;
    Type type;
};

/// @brief Callee signature shared by definitions and extern declarations.
struct FunctionSig
{
    std::string name;
    Generics generics;
    std::vector<Type> params;
    Type ret;
    support::SourceLoc loc{};
};

/// @brief Label table entry.
struct LabeledNode
{
    std::string label;
    NodeType type;
    Node node;
};

/// @brief Function definition with a typed label table.
struct Function
{
    /// Function name without the leading `@`; unique within its Program.
    std::string name;

    Generics generics;

    /// Ordered parameters; each loc has Location::Kind::Param.
    std::vector<Param> params;

    /// Declared return type.
    Type retType;

    /// Local slots; names only, their types live in node types.
    std::vector<Location> locals;

    /// Label table in source order.
    std::vector<LabeledNode> nodes;

    support::SourceLoc loc{};

    /// @brief Signature seen by callers.
    FunctionSig signature() const;

    /// @brief Every location the function's node types must mention.
    std::vector<Location> slots() const;
};

} // namespace tsir::core
