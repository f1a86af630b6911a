//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/NodeChecker.cpp
// Purpose: Implement one typing rule per node kind and the successor check
//          shared by all of them.
// Key invariants: Operands are evaluated left to right, threading the context;
//                 an outgoing context holding `!` satisfies any successor.
// Ownership/Lifetime: Operates on borrowed verifier state only.
// Links: docs/tsir-verifier.md#rules
//
//===----------------------------------------------------------------------===//

#include "tsir/verify/NodeChecker.hpp"

#include "tsir/core/Function.hpp"
#include "tsir/core/Node.hpp"
#include "tsir/core/TypeContext.hpp"
#include "tsir/verify/VerifyCtx.hpp"

#include <set>
#include <string>
#include <utility>
#include <variant>

namespace tsir::verify
{
namespace
{
using core::Lifetime;
using core::Location;
using core::Type;

enum class Transition
{
    Ordinary,
    Begin,
    End
};

Violation atSuccessor(Violation v, const std::string &label)
{
    v.message = "successor '" + label + "': " + v.message;
    return v;
}

/// Check the state leaving a node against the declared type of @p label.
CheckResult checkSuccessor(const VerifyCtx &ctx,
                           const std::string &label,
                           const LocationContext &out,
                           const LifetimeState &cur,
                           Transition transition,
                           const Lifetime *lt = nullptr)
{
    if (out.hasAbsurd())
        return {};

    const NodeState *succ = &ctx.exitState;
    if (label == core::kExitLabel)
    {
        if (auto result = checkExitContext(ctx, out); !result)
            return atSuccessor(result.error(), label);
    }
    else
    {
        auto it = ctx.labels.find(label);
        if (it == ctx.labels.end())
            return makeViolation(VerifyDiagCode::MalformedContext, "unknown label '" + label + "'");
        succ = &ctx.states[it->second];
        if (auto result = ctx.engine.equalsRequired(out, succ->ctx); !result)
            return atSuccessor(result.error(), label);
    }

    CheckResult result;
    switch (transition)
    {
        case Transition::Ordinary:
            result = ctx.lifetimes.propagate(cur, succ->lifetimes);
            break;
        case Transition::Begin:
            result = ctx.lifetimes.begin(*lt, cur, succ->lifetimes);
            break;
        case Transition::End:
            result = ctx.lifetimes.end(*lt, cur, succ->lifetimes);
            break;
    }
    if (!result)
        return atSuccessor(result.error(), label);
    return {};
}

/// Lifetimes mentioned by @p type that are not active in @p state.
std::vector<Lifetime> inactiveLifetimes(const Type &type, const LifetimeState &state)
{
    std::set<Lifetime> mentioned;
    type.collectLifetimes(mentioned);
    std::vector<Lifetime> out;
    for (const auto &lt : mentioned)
    {
        if (!state.active.count(lt))
            out.push_back(lt);
    }
    return out;
}

CheckResult checkAssign(const VerifyCtx &ctx, const core::AssignNode &node, const NodeState &in)
{
    if (auto result = ctx.engine.requireUninit(node.dest, in.ctx); !result)
        return result;

    LocationContext cur = in.ctx;
    Type value;
    if (node.value.kind == core::Rvalue::Kind::Use)
    {
        if (node.value.operands.size() != 1)
            return makeViolation(VerifyDiagCode::MalformedContext, "assignment needs one operand");
        auto consumed = ctx.engine.operand(node.value.operands.front(), cur);
        if (!consumed)
            return consumed.error();
        value = std::move(consumed.value().type);
        cur = std::move(consumed.value().ctx);
    }
    else
    {
        const core::PrimOpDecl *prim = ctx.types.findPrimOp(node.value.op);
        if (!prim)
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 "unknown primop '" + node.value.op + "'");
        const size_t arity = node.value.kind == core::Rvalue::Kind::Unary ? 1 : 2;
        if (prim->params.size() != arity || node.value.operands.size() != arity)
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 "primop '" + prim->name + "' takes " +
                                     std::to_string(prim->params.size()) + " operands");
        for (size_t i = 0; i < arity; ++i)
        {
            const core::Operand &op = node.value.operands[i];
            auto consumed = ctx.engine.operand(op, cur);
            if (!consumed)
                return consumed.error();
            if (!ctx.relations.isSubtype(consumed.value().type, prim->params[i]))
            {
                std::vector<Location> locs;
                if (op.kind == core::Operand::Kind::Use)
                    locs.push_back(op.loc);
                return makeViolation(VerifyDiagCode::TypeMismatch,
                                     "operand " + std::to_string(i) + " of '" + prim->name +
                                         "' is " + consumed.value().type.toString() +
                                         ", expected " + prim->params[i].toString(),
                                     std::move(locs));
            }
            cur = std::move(consumed.value().ctx);
        }
        value = prim->result;
    }

    auto out = ctx.engine.assign(node.dest, value, cur);
    if (!out)
        return out.error();
    return checkSuccessor(ctx, node.next, out.value(), in.lifetimes, Transition::Ordinary);
}

CheckResult checkCall(const VerifyCtx &ctx, const core::CallNode &node, const NodeState &in)
{
    if (auto result = ctx.engine.requireUninit(node.dest, in.ctx); !result)
        return result;

    auto sigIt = ctx.signatures.find(node.callee);
    if (sigIt == ctx.signatures.end())
        return makeViolation(VerifyDiagCode::UnresolvedTraitBound,
                             "unknown callee '@" + node.callee + "'");
    const core::FunctionSig &sig = sigIt->second;

    if (node.lifetimeArgs.size() != sig.generics.lifetimes.size() ||
        node.typeArgs.size() != sig.generics.types.size())
        return makeViolation(VerifyDiagCode::MalformedContext,
                             "'@" + sig.name + "' expects " +
                                 std::to_string(sig.generics.lifetimes.size()) + " lifetime and " +
                                 std::to_string(sig.generics.types.size()) + " type arguments");

    core::Substitution subst;
    for (size_t i = 0; i < node.lifetimeArgs.size(); ++i)
    {
        const Lifetime &arg = node.lifetimeArgs[i];
        if (!in.lifetimes.active.count(arg))
            return makeViolation(VerifyDiagCode::DanglingLifetime,
                                 "lifetime argument " + arg.toString() + " is not active");
        subst.lifetimes[sig.generics.lifetimes[i].name] = arg;
    }
    for (size_t i = 0; i < node.typeArgs.size(); ++i)
    {
        const Type &arg = node.typeArgs[i];
        const core::TypeParam &param = sig.generics.types[i];
        if (auto wf = ctx.types.checkWellFormed(arg); !wf)
            return makeViolation(VerifyDiagCode::MalformedContext, wf.error().message);
        if (auto dangling = inactiveLifetimes(arg, in.lifetimes); !dangling.empty())
            return makeViolation(VerifyDiagCode::DanglingLifetime,
                                 "type argument " + arg.toString() + " mentions inactive " +
                                     dangling.front().toString());
        const auto size = ctx.types.sizeOf(arg);
        if (!arg.isAbsurd() && size != param.size)
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 "type argument " + arg.toString() + " does not fit " + param.name +
                                     "[" + std::to_string(param.size) + "]");
        subst.types[param.name] = arg;
    }

    if (node.args.size() != sig.params.size())
        return makeViolation(VerifyDiagCode::MalformedContext,
                             "'@" + sig.name + "' expects " + std::to_string(sig.params.size()) +
                                 " arguments, got " + std::to_string(node.args.size()));

    LocationContext cur = in.ctx;
    for (size_t i = 0; i < node.args.size(); ++i)
    {
        const core::Operand &op = node.args[i];
        auto consumed = ctx.engine.operand(op, cur);
        if (!consumed)
            return consumed.error();
        const Type want = core::substitute(sig.params[i], subst);
        if (!ctx.relations.isSubtype(consumed.value().type, want))
        {
            std::vector<Location> locs;
            if (op.kind == core::Operand::Kind::Use)
                locs.push_back(op.loc);
            return makeViolation(VerifyDiagCode::TypeMismatch,
                                 "argument " + std::to_string(i) + " is " +
                                     consumed.value().type.toString() + ", expected " +
                                     want.toString(),
                                 std::move(locs));
        }
        cur = std::move(consumed.value().ctx);
    }

    for (const auto &bound : sig.generics.traitBounds)
    {
        const core::TraitBound inst = core::substitute(bound, subst);
        if (!ctx.types.holds(inst.type, inst.trait))
            return makeViolation(VerifyDiagCode::UnresolvedTraitBound,
                                 "no fact proves " + inst.toString());
    }

    std::vector<core::Outlives> obligations;
    obligations.reserve(sig.generics.outlives.size());
    for (const auto &bound : sig.generics.outlives)
        obligations.push_back(core::substitute(bound, subst));
    if (auto result = ctx.lifetimes.callObligations(obligations, in.lifetimes); !result)
        return result;

    auto out = ctx.engine.assign(node.dest, core::substitute(sig.ret, subst), cur);
    if (!out)
        return out.error();
    return checkSuccessor(ctx, node.next, out.value(), in.lifetimes, Transition::Ordinary);
}

CheckResult checkIf(const VerifyCtx &ctx, const core::IfNode &node, const NodeState &in)
{
    auto consumed = ctx.engine.operand(node.cond, in.ctx);
    if (!consumed)
        return consumed.error();
    const Type want = ctx.types.conditionType();
    if (!ctx.relations.isSubtype(consumed.value().type, want))
        return makeViolation(VerifyDiagCode::TypeMismatch,
                             "condition is " + consumed.value().type.toString() + ", expected " +
                                 want.toString());

    const LocationContext &out = consumed.value().ctx;
    if (auto result = checkSuccessor(ctx, node.thenLabel, out, in.lifetimes, Transition::Ordinary);
        !result)
        return result;
    return checkSuccessor(ctx, node.elseLabel, out, in.lifetimes, Transition::Ordinary);
}

CheckResult checkSwitch(const VerifyCtx &ctx, const core::SwitchNode &node, const NodeState &in)
{
    const Type *current = node.scrutinee.isStatic() ? ctx.engine.statics().find(node.scrutinee)
                                                    : in.ctx.find(node.scrutinee);
    if (!current)
        return makeViolation(VerifyDiagCode::MalformedContext,
                             node.scrutinee.toString() + " is not in the context",
                             {node.scrutinee});
    if (current->isUninit())
        return makeViolation(VerifyDiagCode::UseAfterMove,
                             "switch on uninitialized " + node.scrutinee.toString(),
                             {node.scrutinee});
    if (auto wf = ctx.types.checkWellFormed(node.staticType); !wf)
        return makeViolation(VerifyDiagCode::MalformedContext, wf.error().message);
    if (!ctx.relations.isSubtype(*current, node.staticType))
        return makeViolation(VerifyDiagCode::TypeMismatch,
                             node.scrutinee.toString() + " is " + current->toString() +
                                 ", not a subtype of " + node.staticType.toString(),
                             {node.scrutinee});

    std::vector<Type> armTypes;
    armTypes.reserve(node.arms.size());
    for (const auto &arm : node.arms)
    {
        if (auto wf = ctx.types.checkWellFormed(arm.type); !wf)
            return makeViolation(VerifyDiagCode::MalformedContext, wf.error().message);
        if (!ctx.relations.isSubtype(arm.type, node.staticType))
            return makeViolation(VerifyDiagCode::TypeMismatch,
                                 "arm " + arm.type.toString() + " is not a subtype of " +
                                     node.staticType.toString());
        armTypes.push_back(arm.type);
    }
    if (!ctx.relations.covers(armTypes, node.staticType))
        return makeViolation(VerifyDiagCode::NonExhaustiveSwitch,
                             "arms do not cover " + node.staticType.toString(),
                             {node.scrutinee});

    for (const auto &arm : node.arms)
    {
        LocationContext out = in.ctx;
        if (!node.scrutinee.isStatic())
            out.set(node.scrutinee, ctx.relations.meet(*current, arm.type));
        if (auto result = checkSuccessor(ctx, arm.label, out, in.lifetimes, Transition::Ordinary);
            !result)
            return result;
    }
    return {};
}

CheckResult checkDrop(const VerifyCtx &ctx, const core::DropNode &node, const NodeState &in)
{
    auto out = ctx.engine.drop(node.target, in.ctx);
    if (!out)
        return out.error();
    return checkSuccessor(ctx, node.next, out.value(), in.lifetimes, Transition::Ordinary);
}

CheckResult checkBegin(const VerifyCtx &ctx,
                       const core::LifetimeBeginNode &node,
                       const NodeState &in)
{
    return checkSuccessor(ctx, node.next, in.ctx, in.lifetimes, Transition::Begin, &node.lifetime);
}

CheckResult checkEnd(const VerifyCtx &ctx, const core::LifetimeEndNode &node, const NodeState &in)
{
    if (auto result = ctx.lifetimes.endLocal(node.lifetime, in.lifetimes, in.ctx); !result)
        return result;
    return checkSuccessor(ctx, node.next, in.ctx, in.lifetimes, Transition::End, &node.lifetime);
}

CheckResult checkDeadCode(const NodeState &in)
{
    if (!in.ctx.hasAbsurd())
        return makeViolation(VerifyDiagCode::TypeMismatch,
                             "unreachable point has no absurd location");
    return {};
}

} // namespace

CheckResult checkExitContext(const VerifyCtx &ctx, const LocationContext &out)
{
    for (const auto &[loc, type] : out)
    {
        if (loc.kind == Location::Kind::Return)
        {
            if (!ctx.relations.isSubtype(type, ctx.fn.retType))
                return makeViolation(VerifyDiagCode::TypeMismatch,
                                     "return slot holds " + type.toString() + ", expected " +
                                         ctx.fn.retType.toString(),
                                     {loc});
            continue;
        }
        if (!type.isUninit())
            return makeViolation(VerifyDiagCode::TypeMismatch,
                                 loc.toString() + " still holds " + type.toString() + " at exit",
                                 {loc});
    }
    if (!out.contains(Location::returnSlot()))
        return makeViolation(VerifyDiagCode::MalformedContext,
                             "return slot missing at exit",
                             {Location::returnSlot()});
    return {};
}

CheckResult checkNode(const VerifyCtx &ctx, size_t index)
{
    const core::LabeledNode &entry = ctx.fn.nodes[index];
    const NodeState &in = ctx.states[index];
    if (in.ctx.hasAbsurd())
        return {};

    return std::visit(
        core::Overload{
            [&](const core::AssignNode &n) { return checkAssign(ctx, n, in); },
            [&](const core::CallNode &n) { return checkCall(ctx, n, in); },
            [&](const core::IfNode &n) { return checkIf(ctx, n, in); },
            [&](const core::SwitchNode &n) { return checkSwitch(ctx, n, in); },
            [&](const core::DropNode &n) { return checkDrop(ctx, n, in); },
            [&](const core::LifetimeBeginNode &n) { return checkBegin(ctx, n, in); },
            [&](const core::LifetimeEndNode &n) { return checkEnd(ctx, n, in); },
            [&](const core::DeadCodeNode &) { return checkDeadCode(in); }},
        entry.node.kind);
}

} // namespace tsir::verify
