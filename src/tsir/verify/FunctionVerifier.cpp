//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/FunctionVerifier.cpp
// Purpose: Implement per-function scoping, signature and entry checks, and
//          judgment rendering.
// Key invariants: The entry label starts with parameters initialized per the
//                 signature, locals and the return slot uninit, only 'static
//                 and the lifetime parameters active, and exactly the
//                 where-clause outlives facts assumed.
// Links: docs/tsir-verifier.md#functions
//
//===----------------------------------------------------------------------===//

#include "tsir/verify/FunctionVerifier.hpp"

#include "tsir/verify/CfgVerifier.hpp"
#include "tsir/verify/DiagSink.hpp"

#include <set>
#include <sstream>
#include <utility>
#include <variant>

namespace tsir::verify
{
namespace
{
using core::Lifetime;
using core::Location;
using core::Type;

std::string joinTypes(const std::vector<Type> &types)
{
    std::ostringstream os;
    for (size_t i = 0; i < types.size(); ++i)
    {
        if (i)
            os << ", ";
        os << types[i].toString();
    }
    return os.str();
}

Violation atFunction(Violation v, const core::Function &fn, std::string label = {})
{
    v.function = fn.name;
    v.label = std::move(label);
    if (!v.loc.hasLine())
        v.loc = fn.loc;
    return v;
}

/// Signature types may only mention 'static and the lifetime parameters.
CheckResult checkSignatureType(const Type &type,
                               const core::TypeContext &scope,
                               const std::set<Lifetime> &pinned,
                               const std::string &what)
{
    if (auto wf = scope.checkWellFormed(type); !wf)
        return makeViolation(VerifyDiagCode::MalformedContext, what + ": " + wf.error().message);
    std::set<Lifetime> mentioned;
    type.collectLifetimes(mentioned);
    for (const auto &lt : mentioned)
    {
        if (!pinned.count(lt))
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 what + " mentions local lifetime " + lt.toString());
    }
    if (!type.isAbsurd() && !scope.sizeOf(type))
        return makeViolation(VerifyDiagCode::MalformedContext,
                             what + ": type " + type.toString() + " has no size");
    return {};
}
} // namespace

std::string Judgment::toString() const
{
    std::ostringstream os;
    if (!generics.lifetimes.empty() || !generics.types.empty())
    {
        os << "forall<";
        bool first = true;
        for (const auto &lt : generics.lifetimes)
        {
            if (!first)
                os << ", ";
            first = false;
            os << lt.toString();
        }
        for (const auto &tp : generics.types)
        {
            if (!first)
                os << ", ";
            first = false;
            os << tp.name;
        }
        os << "> ";
    }
    if (!generics.traitBounds.empty() || !generics.outlives.empty())
    {
        os << "where ";
        bool first = true;
        for (const auto &bound : generics.traitBounds)
        {
            if (!first)
                os << ", ";
            first = false;
            os << bound.toString();
        }
        for (const auto &fact : generics.outlives)
        {
            if (!first)
                os << ", ";
            first = false;
            os << fact.toString();
        }
        os << ' ';
    }
    if (os.tellp() > 0)
        os << ". ";
    os << "fn @" << function << '(' << joinTypes(params) << ") -> " << ret.toString();
    return os.str();
}

void addGenericsToScope(const core::Generics &generics, core::TypeContext &scope)
{
    for (const auto &lt : generics.lifetimes)
        scope.addLifetime(core::LifetimeDecl{lt, core::LifetimeDecl::Origin::Param});
    for (const auto &tp : generics.types)
        scope.addTypeParam(tp);
    for (const auto &bound : generics.traitBounds)
        scope.addPostulate(bound);
}

FunctionVerifier::FunctionVerifier(const core::TypeContext &types,
                                   const LocationContext &statics,
                                   const SignatureMap &signatures,
                                   const support::Options &options,
                                   DiagSink *sink)
    : types_(types), statics_(statics), signatures_(signatures), options_(options), sink_(sink)
{
}

CheckResult FunctionVerifier::checkSignature(const core::Function &fn,
                                             const core::TypeContext &scope) const
{
    std::set<Lifetime> pinned{Lifetime::staticLifetime()};
    pinned.insert(fn.generics.lifetimes.begin(), fn.generics.lifetimes.end());

    std::set<Location> seen;
    for (const auto &param : fn.params)
    {
        if (param.loc.kind != Location::Kind::Param)
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 param.loc.toString() + " is not a parameter location",
                                 {param.loc});
        if (!seen.insert(param.loc).second)
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 "duplicate parameter " + param.loc.toString(),
                                 {param.loc});
        if (auto result =
                checkSignatureType(param.type, scope, pinned, "parameter " + param.loc.toString());
            !result)
            return result;
    }
    for (const auto &local : fn.locals)
    {
        if (local.kind != Location::Kind::Local)
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 local.toString() + " is not a local location",
                                 {local});
        if (!seen.insert(local).second)
            return makeViolation(
                VerifyDiagCode::MalformedContext, "duplicate local " + local.toString(), {local});
    }
    if (auto result = checkSignatureType(fn.retType, scope, pinned, "return type"); !result)
        return result;

    for (const auto &fact : fn.generics.outlives)
    {
        std::set<Lifetime> mentioned{fact.shorter};
        if (fact.kind == core::Outlives::Kind::Lifetime)
            mentioned.insert(fact.longer);
        else if (auto result = checkSignatureType(fact.type, scope, pinned, fact.toString());
                 !result)
            return result;
        for (const auto &lt : mentioned)
        {
            if (!pinned.count(lt))
                return makeViolation(VerifyDiagCode::MalformedContext,
                                     "where-clause " + fact.toString() + " names undeclared " +
                                         lt.toString());
        }
    }
    return {};
}

CheckResult FunctionVerifier::checkEntry(const core::Function &fn,
                                         const core::TypeContext &scope,
                                         const CfgVerifier &cfg) const
{
    const NodeState &entry = cfg.state(core::kEntryLabel);
    const TypeRelations relations(scope);

    for (const auto &param : fn.params)
    {
        const Type *have = entry.ctx.find(param.loc);
        if (!relations.isSubtype(param.type, *have))
        {
            Violation v = makeViolation(VerifyDiagCode::TypeMismatch,
                                        "entry expects " + param.loc.toString() + ": " +
                                            have->toString() + ", signature declares " +
                                            param.type.toString(),
                                        {param.loc});
            v.actual = entry.ctx.toString();
            return v;
        }
    }
    for (const auto &local : fn.locals)
    {
        if (!entry.ctx.find(local)->isUninit())
            return makeViolation(VerifyDiagCode::TypeMismatch,
                                 local.toString() + " must be uninit at entry",
                                 {local});
    }
    if (!entry.ctx.find(Location::returnSlot())->isUninit())
        return makeViolation(VerifyDiagCode::TypeMismatch,
                             "return slot must be uninit at entry",
                             {Location::returnSlot()});

    std::set<Lifetime> pinned{Lifetime::staticLifetime()};
    pinned.insert(fn.generics.lifetimes.begin(), fn.generics.lifetimes.end());
    if (entry.lifetimes.active != pinned)
    {
        LifetimeState want;
        want.active = pinned;
        Violation v = makeViolation(VerifyDiagCode::MalformedContext,
                                    "entry lifetimes must be 'static and the lifetime parameters");
        v.expected = want.activeToString();
        v.actual = entry.lifetimes.activeToString();
        return v;
    }

    const BoundContext where(fn.generics.outlives);
    if (const auto *extra = where.firstUnentailed(entry.lifetimes.bounds))
        return makeViolation(VerifyDiagCode::ObligationUnproved,
                             "entry assumes " + extra->toString() +
                                 " which the where-clause does not provide");
    if (const auto *missing = entry.lifetimes.bounds.firstUnentailed(where))
        return makeViolation(VerifyDiagCode::ObligationUnproved,
                             "entry does not assume where-clause bound " + missing->toString());
    return {};
}

VResult<Judgment> FunctionVerifier::verify(const core::Function &fn) const
{
    core::TypeContext scope(&types_);
    addGenericsToScope(fn.generics, scope);

    std::set<Lifetime> locals;
    for (const auto &node : fn.nodes)
    {
        if (const auto *begin = std::get_if<core::LifetimeBeginNode>(&node.node.kind))
        {
            if (locals.insert(begin->lifetime).second)
                scope.addLifetime(
                    core::LifetimeDecl{begin->lifetime, core::LifetimeDecl::Origin::Local});
        }
    }

    if (auto valid = scope.validate(); !valid)
        return atFunction(
            makeViolation(VerifyDiagCode::MalformedContext, valid.error().message), fn);
    if (auto result = checkSignature(fn, scope); !result)
        return atFunction(result.error(), fn);

    CfgVerifier cfg(fn, scope, statics_, signatures_, options_, sink_);
    if (auto result = cfg.buildTable(); !result)
        return result.error();
    if (auto result = checkEntry(fn, scope, cfg); !result)
        return atFunction(result.error(), fn, std::string(core::kEntryLabel));
    if (auto result = cfg.checkNodes(); !result)
        return result.error();

    Judgment judgment{fn.name, fn.generics, {}, fn.retType};
    for (const auto &param : fn.params)
        judgment.params.push_back(param.type);
    if (options_.trace && sink_)
        sink_->report(makeTraceNote(fn.loc, "verified " + judgment.toString()));
    return judgment;
}

} // namespace tsir::verify
