//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/Node.cpp
// Purpose: Successor enumeration, rule names and printing for CFG nodes.
// Key invariants: successors() lists arm labels of a switch in arm order.
// Links: docs/tsir-format.md#nodes
//
//===----------------------------------------------------------------------===//

#include "tsir/core/Node.hpp"

#include <sstream>
#include <utility>

namespace tsir::core
{
namespace
{
template <typename Range> std::string join(const Range &items)
{
    std::ostringstream os;
    bool first = true;
    for (const auto &item : items)
    {
        if (!first)
            os << ", ";
        first = false;
        os << item.toString();
    }
    return os.str();
}
} // namespace

Operand Operand::use(Location loc)
{
    Operand op;
    op.kind = Kind::Use;
    op.loc = std::move(loc);
    return op;
}

Operand Operand::constant(Type type)
{
    Operand op;
    op.kind = Kind::Const;
    op.type = std::move(type);
    return op;
}

std::string Operand::toString() const
{
    if (kind == Kind::Const)
        return "const " + type.toString();
    return loc.toString();
}

std::string Rvalue::toString() const
{
    if (kind == Kind::Use)
        return operands.empty() ? std::string{} : operands.front().toString();
    return op + "(" + join(operands) + ")";
}

std::vector<std::string> Node::successors() const
{
    return std::visit(
        Overload{[](const AssignNode &n) { return std::vector<std::string>{n.next}; },
                 [](const CallNode &n) { return std::vector<std::string>{n.next}; },
                 [](const IfNode &n)
                 { return std::vector<std::string>{n.thenLabel, n.elseLabel}; },
                 [](const SwitchNode &n)
                 {
                     std::vector<std::string> out;
                     out.reserve(n.arms.size());
                     for (const auto &arm : n.arms)
                         out.push_back(arm.label);
                     return out;
                 },
                 [](const DropNode &n) { return std::vector<std::string>{n.next}; },
                 [](const LifetimeBeginNode &n) { return std::vector<std::string>{n.next}; },
                 [](const LifetimeEndNode &n) { return std::vector<std::string>{n.next}; },
                 [](const DeadCodeNode &) { return std::vector<std::string>{}; }},
        kind);
}

const char *Node::ruleName() const
{
    return std::visit(Overload{[](const AssignNode &) { return "assign"; },
                               [](const CallNode &) { return "call"; },
                               [](const IfNode &) { return "if"; },
                               [](const SwitchNode &) { return "switch"; },
                               [](const DropNode &) { return "drop"; },
                               [](const LifetimeBeginNode &) { return "begin"; },
                               [](const LifetimeEndNode &) { return "end"; },
                               [](const DeadCodeNode &) { return "unreachable"; }},
                      kind);
}

std::string Node::toString() const
{
    std::ostringstream os;
    std::visit(Overload{[&](const AssignNode &n)
                        {
                            os << "assign " << n.dest.toString() << " = "
                               << n.value.toString() << " -> " << n.next;
                        },
                        [&](const CallNode &n)
                        {
                            os << "call " << n.dest.toString() << " = @" << n.callee;
                            if (!n.lifetimeArgs.empty() || !n.typeArgs.empty())
                            {
                                os << '<' << join(n.lifetimeArgs);
                                if (!n.lifetimeArgs.empty() && !n.typeArgs.empty())
                                    os << ", ";
                                os << join(n.typeArgs) << '>';
                            }
                            os << '(' << join(n.args) << ") -> " << n.next;
                        },
                        [&](const IfNode &n)
                        {
                            os << "if " << n.cond.toString() << " -> " << n.thenLabel << ", "
                               << n.elseLabel;
                        },
                        [&](const SwitchNode &n)
                        {
                            os << "switch " << n.scrutinee.toString() << ": "
                               << n.staticType.toString() << " { ";
                            for (size_t i = 0; i < n.arms.size(); ++i)
                            {
                                if (i)
                                    os << ", ";
                                os << n.arms[i].type.toString() << " -> " << n.arms[i].label;
                            }
                            os << " }";
                        },
                        [&](const DropNode &n)
                        { os << "drop " << n.target.toString() << " -> " << n.next; },
                        [&](const LifetimeBeginNode &n)
                        { os << "begin " << n.lifetime.toString() << " -> " << n.next; },
                        [&](const LifetimeEndNode &n)
                        { os << "end " << n.lifetime.toString() << " -> " << n.next; },
                        [&](const DeadCodeNode &) { os << "unreachable"; }},
               kind);
    return os.str();
}

} // namespace tsir::core
