//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/CfgVerifier.cpp
// Purpose: Implement label indexing, node type well-formedness and the
//          linear node checking pass.
// Key invariants: Slot sizes are fixed per function: parameters and the
//                 return slot by their declared types, locals by the first
//                 node type that sizes them.
// Links: docs/tsir-verifier.md#cfg
//
//===----------------------------------------------------------------------===//

#include "tsir/verify/CfgVerifier.hpp"

#include "tsir/verify/DiagSink.hpp"
#include "tsir/verify/NodeChecker.hpp"

#include <set>
#include <string>
#include <utility>

namespace tsir::verify
{
namespace
{
using core::Lifetime;
using core::Location;

std::set<Lifetime> pinnedLifetimes(const core::Function &fn)
{
    std::set<Lifetime> pinned{Lifetime::staticLifetime()};
    pinned.insert(fn.generics.lifetimes.begin(), fn.generics.lifetimes.end());
    return pinned;
}

void collectFactLifetimes(const core::Outlives &fact, std::set<Lifetime> &out)
{
    out.insert(fact.shorter);
    if (fact.kind == core::Outlives::Kind::Lifetime)
        out.insert(fact.longer);
    else
        fact.type.collectLifetimes(out);
}
} // namespace

CfgVerifier::CfgVerifier(const core::Function &fn,
                         const core::TypeContext &scope,
                         const LocationContext &statics,
                         const SignatureMap &signatures,
                         const support::Options &options,
                         DiagSink *sink)
    : fn_(fn), scope_(scope), signatures_(signatures), options_(options), sink_(sink),
      relations_(scope), engine_(relations_, statics), lifetimes_(pinnedLifetimes(fn))
{
    exitState_.lifetimes.active = lifetimes_.pinned();
    exitState_.lifetimes.bounds = BoundContext(fn.generics.outlives);
}

Violation CfgVerifier::decorate(Violation v, const core::LabeledNode &node) const
{
    v.function = fn_.name;
    v.label = node.label;
    v.rule = node.node.ruleName();
    v.snippet = node.node.toString();
    v.loc = node.node.loc;
    return v;
}

CheckResult CfgVerifier::buildTable()
{
    labels_.clear();
    states_.assign(fn_.nodes.size(), NodeState{});

    for (size_t i = 0; i < fn_.nodes.size(); ++i)
    {
        const auto &node = fn_.nodes[i];
        if (node.label == core::kExitLabel)
            return decorate(makeViolation(VerifyDiagCode::MalformedContext,
                                          "label 'exit' is reserved and cannot be defined"),
                            node);
        if (!labels_.emplace(node.label, i).second)
            return decorate(makeViolation(VerifyDiagCode::MalformedContext,
                                          "duplicate label '" + node.label + "'"),
                            node);
    }
    if (labels_.find(core::kEntryLabel) == labels_.end())
    {
        Violation v = makeViolation(VerifyDiagCode::MalformedContext, "missing 'entry' label");
        v.function = fn_.name;
        v.loc = fn_.loc;
        return v;
    }

    for (const auto &node : fn_.nodes)
    {
        for (const auto &succ : node.node.successors())
        {
            if (succ != core::kExitLabel && labels_.find(succ) == labels_.end())
                return decorate(makeViolation(VerifyDiagCode::MalformedContext,
                                              "unknown label '" + succ + "'"),
                                node);
        }
    }

    std::map<Location, uint64_t> sizes;
    for (const auto &param : fn_.params)
    {
        if (auto size = scope_.sizeOf(param.type))
            sizes.emplace(param.loc, *size);
    }
    if (auto size = scope_.sizeOf(fn_.retType))
        sizes.emplace(Location::returnSlot(), *size);

    for (size_t i = 0; i < fn_.nodes.size(); ++i)
    {
        if (auto result = checkNodeType(fn_.nodes[i], sizes, states_[i]); !result)
            return decorate(result.error(), fn_.nodes[i]);
    }
    return {};
}

CheckResult CfgVerifier::checkNodeType(const core::LabeledNode &node,
                                       std::map<Location, uint64_t> &sizes,
                                       NodeState &state) const
{
    auto ctx = LocationContext::fromBindings(node.type.locations);
    if (!ctx)
        return ctx.error();

    const std::vector<Location> slots = fn_.slots();
    const std::set<Location> slotSet(slots.begin(), slots.end());
    for (const auto &[loc, type] : ctx.value())
    {
        if (loc.isStatic())
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 "static " + loc.toString() + " listed in a node type",
                                 {loc});
        if (!slotSet.count(loc))
            return makeViolation(
                VerifyDiagCode::MalformedContext, "unknown location " + loc.toString(), {loc});
    }
    for (const auto &slot : slots)
    {
        if (!ctx.value().contains(slot))
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 slot.toString() + " missing from node type",
                                 {slot});
    }

    LifetimeState lifetimes = LifetimeState::fromNodeType(node.type);
    for (const auto &lt : node.type.lifetimes)
    {
        if (!scope_.hasLifetime(lt))
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 "undeclared lifetime " + lt.toString());
    }
    if (!lifetimes.active.count(Lifetime::staticLifetime()))
        return makeViolation(VerifyDiagCode::MalformedContext, "'static must always be active");

    for (const auto &[loc, type] : ctx.value())
    {
        if (auto wf = scope_.checkWellFormed(type); !wf)
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 loc.toString() + ": " + wf.error().message,
                                 {loc});
        std::set<Lifetime> mentioned;
        type.collectLifetimes(mentioned);
        for (const auto &lt : mentioned)
        {
            if (!lifetimes.active.count(lt))
                return makeViolation(
                    VerifyDiagCode::DanglingLifetime,
                    loc.toString() + " mentions inactive lifetime " + lt.toString(),
                    {loc});
        }
        if (type.isAbsurd())
            continue;
        const auto size = scope_.sizeOf(type);
        if (!size)
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 loc.toString() + ": type " + type.toString() + " has no size",
                                 {loc});
        auto [it, inserted] = sizes.emplace(loc, *size);
        if (!inserted && it->second != *size)
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 loc.toString() + " has size " + std::to_string(it->second) +
                                     ", but " + type.toString() + " has size " +
                                     std::to_string(*size),
                                 {loc});
    }

    for (const auto &fact : node.type.bounds)
    {
        if (fact.kind == core::Outlives::Kind::Type)
        {
            if (auto wf = scope_.checkWellFormed(fact.type); !wf)
                return makeViolation(VerifyDiagCode::MalformedContext,
                                     fact.toString() + ": " + wf.error().message);
        }
        std::set<Lifetime> mentioned;
        collectFactLifetimes(fact, mentioned);
        for (const auto &lt : mentioned)
        {
            if (!scope_.hasLifetime(lt))
                return makeViolation(VerifyDiagCode::MalformedContext,
                                     fact.toString() + ": undeclared lifetime " + lt.toString());
            if (!lifetimes.active.count(lt))
                return makeViolation(VerifyDiagCode::DanglingLifetime,
                                     fact.toString() + " mentions inactive lifetime " +
                                         lt.toString());
        }
    }

    state.ctx = std::move(ctx.value());
    state.lifetimes = std::move(lifetimes);
    return {};
}

CheckResult CfgVerifier::checkNodes() const
{
    const VerifyCtx ctx{
        fn_, scope_, relations_, engine_, lifetimes_, signatures_, labels_, states_, exitState_};

    for (size_t i = 0; i < fn_.nodes.size(); ++i)
    {
        const auto &node = fn_.nodes[i];
        if (options_.trace && sink_)
            sink_->report(makeTraceNote(node.node.loc,
                                        "@" + fn_.name + ":" + node.label + ": " +
                                            node.node.toString()));
        if (auto result = checkNode(ctx, i); !result)
        {
            Violation v = result.error();
            if (v.actual.empty())
                v.actual = states_[i].ctx.toString();
            return decorate(std::move(v), node);
        }
    }
    return {};
}

const NodeState &CfgVerifier::state(std::string_view label) const
{
    auto it = labels_.find(label);
    return it == labels_.end() ? exitState_ : states_[it->second];
}

} // namespace tsir::verify
