//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the closed set of CFG node kinds.  Every label of a
// function owns exactly one node; control leaves a node through the labels
// returned by successors().  Nodes carry no typing information of their own:
// the verifier reads the NodeType declared on the node's label and on each
// successor label.
//
// Node kinds:
// - Assign: write an rvalue (operand, unary or binary primitive) into a slot
// - Call: invoke a defined or extern function, writing its result
// - If: two-way branch on an operand of the condition type
// - Switch: multi-way branch narrowing a location to variant types
// - Drop: release a Copy value, returning the slot to uninit
// - LifetimeBegin / LifetimeEnd: open and close a local region
// - DeadCode: marks an unreachable point
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include "tsir/core/Lifetime.hpp"
#include "tsir/core/Location.hpp"
#include "tsir/core/Type.hpp"

#include <string>
#include <variant>
#include <vector>

namespace tsir::core
{

/// @brief Read of a location or a typed constant.
struct Operand
{
    enum class Kind
    {
        Use,
        Const
    };

    Kind kind = Kind::Use;
    Location loc;  ///< Valid when kind == Use.
    Type type;     ///< Valid when kind == Const.

    static Operand use(Location loc);
    static Operand constant(Type type);

    std::string toString() const;
};

/// @brief Right-hand side of an assignment.
struct Rvalue
{
    enum class Kind
    {
        Use,
        Unary,
        Binary
    };

    Kind kind = Kind::Use;

    /// Primitive operation name; empty for Use.
    std::string op;

    /// One operand for Use and Unary, two for Binary.
    std::vector<Operand> operands;

    std::string toString() const;
};

struct AssignNode
{
    Location dest;
    Rvalue value;
    std::string next;
};

struct CallNode
{
    Location dest;
    std::string callee;
    std::vector<Lifetime> lifetimeArgs;
    std::vector<Type> typeArgs;
    std::vector<Operand> args;
    std::string next;
};

struct IfNode
{
    Operand cond;
    std::string thenLabel;
    std::string elseLabel;
};

struct SwitchArm
{
    Type type;
    std::string label;
};

struct SwitchNode
{
    Location scrutinee;
    Type staticType;
    std::vector<SwitchArm> arms;
};

struct DropNode
{
    Location target;
    std::string next;
};

struct LifetimeBeginNode
{
    Lifetime lifetime;
    std::string next;
};

struct LifetimeEndNode
{
    Lifetime lifetime;
    std::string next;
};

struct DeadCodeNode
{
};

using NodeKind = std::variant<AssignNode,
                              CallNode,
                              IfNode,
                              SwitchNode,
                              DropNode,
                              LifetimeBeginNode,
                              LifetimeEndNode,
                              DeadCodeNode>;

/// @brief CFG node together with its source position.
struct Node
{
    NodeKind kind;
    support::SourceLoc loc{};

    /// @brief Labels control may transfer to, in source order.
    std::vector<std::string> successors() const;

    /// @brief Short rule name of the node kind, e.g. "assign".
    const char *ruleName() const;

    /// @brief Render the node in textual IR syntax.
    std::string toString() const;
};

/// @brief Helper for std::visit over node kinds.
template <typename... Ts> struct Overload : Ts...
{
    using Ts::operator()...;
};

template <typename... Ts> Overload(Ts...) -> Overload<Ts...>;

} // namespace tsir::core
