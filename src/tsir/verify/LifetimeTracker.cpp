//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/LifetimeTracker.cpp
// Purpose: Implement outlives entailment and the lifetime transition rules.
// Key invariants: Checks are local to one node and its successor; no state
//                 survives between calls, so cycles in the CFG need no fixpoint.
// Links: docs/tsir-verifier.md#lifetimes
//
//===----------------------------------------------------------------------===//

#include "tsir/verify/LifetimeTracker.hpp"

#include <deque>
#include <sstream>

namespace tsir::verify
{

using core::Lifetime;
using core::Outlives;
using core::Type;

BoundContext::BoundContext(std::vector<Outlives> facts) : facts_(std::move(facts)) {}

void BoundContext::add(Outlives fact)
{
    facts_.push_back(std::move(fact));
}

bool BoundContext::outlives(const Lifetime &longer, const Lifetime &shorter) const
{
    if (longer == shorter || longer.isStatic())
        return true;

    std::set<Lifetime> seen{longer};
    std::deque<Lifetime> work{longer};
    while (!work.empty())
    {
        const Lifetime cur = work.front();
        work.pop_front();
        for (const auto &fact : facts_)
        {
            if (fact.kind != Outlives::Kind::Lifetime || fact.longer != cur)
                continue;
            if (fact.shorter == shorter || fact.shorter.isStatic())
                return true;
            if (seen.insert(fact.shorter).second)
                work.push_back(fact.shorter);
        }
    }
    return false;
}

bool BoundContext::typeOutlives(const Type &type, const Lifetime &shorter) const
{
    if (type.isUninit() || type.isAbsurd())
        return true;

    for (const auto &fact : facts_)
    {
        if (fact.kind == Outlives::Kind::Type && fact.type == type &&
            outlives(fact.shorter, shorter))
            return true;
    }

    if (type.kind != Type::Kind::User)
        return false;
    for (const auto &lt : type.lifetimeArgs)
    {
        if (!outlives(lt, shorter))
            return false;
    }
    for (const auto &arg : type.typeArgs)
    {
        if (!typeOutlives(arg, shorter))
            return false;
    }
    return true;
}

bool BoundContext::entails(const Outlives &fact) const
{
    if (fact.kind == Outlives::Kind::Lifetime)
        return outlives(fact.longer, fact.shorter);
    return typeOutlives(fact.type, fact.shorter);
}

const Outlives *BoundContext::firstUnentailed(const BoundContext &other) const
{
    for (const auto &fact : other.facts_)
    {
        if (!entails(fact))
            return &fact;
    }
    return nullptr;
}

BoundContext BoundContext::without(const Lifetime &lt) const
{
    BoundContext out;
    for (const auto &fact : facts_)
    {
        if (!fact.mentions(lt))
            out.facts_.push_back(fact);
    }
    return out;
}

std::string BoundContext::toString() const
{
    std::ostringstream os;
    os << '{';
    for (size_t i = 0; i < facts_.size(); ++i)
    {
        if (i)
            os << ", ";
        os << facts_[i].toString();
    }
    os << '}';
    return os.str();
}

LifetimeState LifetimeState::fromNodeType(const core::NodeType &type)
{
    LifetimeState state;
    state.active.insert(type.lifetimes.begin(), type.lifetimes.end());
    state.bounds = BoundContext(type.bounds);
    return state;
}

std::string LifetimeState::activeToString() const
{
    std::ostringstream os;
    os << '{';
    bool first = true;
    for (const auto &lt : active)
    {
        if (!first)
            os << ", ";
        first = false;
        os << lt.toString();
    }
    os << '}';
    return os.str();
}

namespace
{
std::string lifetimeSetToString(const std::set<Lifetime> &set)
{
    LifetimeState state;
    state.active = set;
    return state.activeToString();
}

CheckResult requireEntailed(const BoundContext &base, const BoundContext &succ)
{
    if (const Outlives *missing = base.firstUnentailed(succ))
    {
        Violation v = makeViolation(VerifyDiagCode::ObligationUnproved,
                                    "cannot prove " + missing->toString());
        v.expected = succ.toString();
        v.actual = base.toString();
        return v;
    }
    return {};
}
} // namespace

BoundContext LifetimeTracker::derivedFacts(const Lifetime &lt,
                                           const std::set<Lifetime> &active,
                                           const BoundContext &base)
{
    BoundContext out = base;
    for (const auto &a : active)
    {
        if (a != lt)
            out.add(Outlives::lifetimes(a, lt));
    }
    return out;
}

CheckResult LifetimeTracker::compareActive(const std::set<Lifetime> &want,
                                           const std::set<Lifetime> &have) const
{
    for (const auto &lt : have)
    {
        if (!want.count(lt))
        {
            Violation v = makeViolation(VerifyDiagCode::DanglingLifetime,
                                        "successor expects inactive lifetime " + lt.toString());
            v.expected = lifetimeSetToString(have);
            v.actual = lifetimeSetToString(want);
            return v;
        }
    }
    for (const auto &lt : want)
    {
        if (!have.count(lt))
        {
            Violation v = makeViolation(VerifyDiagCode::MalformedContext,
                                        "successor omits active lifetime " + lt.toString());
            v.expected = lifetimeSetToString(have);
            v.actual = lifetimeSetToString(want);
            return v;
        }
    }
    return {};
}

bool LifetimeTracker::mentionsLocal(const Outlives &fact) const
{
    std::set<Lifetime> mentioned{fact.shorter};
    if (fact.kind == Outlives::Kind::Lifetime)
        mentioned.insert(fact.longer);
    else
        fact.type.collectLifetimes(mentioned);
    for (const auto &lt : mentioned)
    {
        if (!isPinned(lt))
            return true;
    }
    return false;
}

CheckResult LifetimeTracker::keepPending(const BoundContext &cur,
                                         const BoundContext &succ,
                                         const Lifetime *ending) const
{
    for (const auto &fact : cur.facts())
    {
        if (ending && fact.mentions(*ending))
            continue;
        if (!mentionsLocal(fact) || succ.entails(fact))
            continue;
        Violation v = makeViolation(VerifyDiagCode::ObligationUnproved,
                                    "pending " + fact.toString() +
                                        " dropped before its lifetimes end");
        v.expected = cur.toString();
        v.actual = succ.toString();
        return v;
    }
    return {};
}

CheckResult LifetimeTracker::propagate(const LifetimeState &cur, const LifetimeState &succ) const
{
    if (auto result = compareActive(cur.active, succ.active); !result)
        return result;
    if (auto result = requireEntailed(cur.bounds, succ.bounds); !result)
        return result;
    return keepPending(cur.bounds, succ.bounds);
}

CheckResult LifetimeTracker::begin(const Lifetime &lt,
                                   const LifetimeState &cur,
                                   const LifetimeState &succ) const
{
    if (isPinned(lt))
        return makeViolation(VerifyDiagCode::MalformedContext,
                             "cannot begin signature lifetime " + lt.toString());
    if (cur.active.count(lt))
        return makeViolation(VerifyDiagCode::MalformedContext,
                             "lifetime " + lt.toString() + " is already active");

    std::set<Lifetime> want = cur.active;
    want.insert(lt);
    if (auto result = compareActive(want, succ.active); !result)
        return result;
    if (auto result = requireEntailed(derivedFacts(lt, cur.active, cur.bounds), succ.bounds);
        !result)
        return result;
    return keepPending(cur.bounds, succ.bounds);
}

CheckResult LifetimeTracker::endLocal(const Lifetime &lt,
                                      const LifetimeState &cur,
                                      const LocationContext &ctx) const
{
    if (isPinned(lt))
        return makeViolation(VerifyDiagCode::MalformedContext,
                             "cannot end signature lifetime " + lt.toString());
    if (!cur.active.count(lt))
        return makeViolation(VerifyDiagCode::MalformedContext,
                             "lifetime " + lt.toString() + " is not active");

    if (auto dangling = ctx.locationsMentioning(lt); !dangling.empty())
    {
        Violation v = makeViolation(VerifyDiagCode::DanglingLifetime,
                                    "lifetime " + lt.toString() + " ends while still referenced",
                                    std::move(dangling));
        v.actual = ctx.toString();
        return v;
    }

    std::set<Lifetime> remaining = cur.active;
    remaining.erase(lt);
    const BoundContext derived = derivedFacts(lt, remaining, cur.bounds.without(lt));

    for (const auto &fact : cur.bounds.facts())
    {
        if (fact.shorter == lt)
        {
            if (!derived.entails(fact))
                return makeViolation(VerifyDiagCode::ObligationUnproved,
                                     "pending " + fact.toString() + " not discharged when " +
                                         lt.toString() + " ends");
            continue;
        }
        if (!remaining.count(fact.shorter))
            continue;
        const bool longerIsEnding =
            fact.kind == Outlives::Kind::Lifetime ? fact.longer == lt : fact.type.mentions(lt);
        if (longerIsEnding)
            return makeViolation(VerifyDiagCode::ObligationUnproved,
                                 "obligation " + fact.toString() + " violated: " + lt.toString() +
                                     " ends before " + fact.shorter.toString());
    }
    return {};
}

CheckResult LifetimeTracker::end(const Lifetime &lt,
                                 const LifetimeState &cur,
                                 const LifetimeState &succ) const
{
    std::set<Lifetime> want = cur.active;
    want.erase(lt);
    if (auto result = compareActive(want, succ.active); !result)
        return result;
    if (auto result = requireEntailed(derivedFacts(lt, want, cur.bounds), succ.bounds); !result)
        return result;
    return keepPending(cur.bounds, succ.bounds, &lt);
}

CheckResult LifetimeTracker::callObligations(const std::vector<Outlives> &bounds,
                                             const LifetimeState &cur) const
{
    for (const auto &bound : bounds)
    {
        if (!cur.bounds.entails(bound))
        {
            Violation v = makeViolation(VerifyDiagCode::ObligationUnproved,
                                        "call requires " + bound.toString());
            v.actual = cur.bounds.toString();
            return v;
        }
    }
    return {};
}

bool isSubNodeType(const ContextEngine &engine,
                   const core::NodeType &sub,
                   const core::NodeType &super)
{
    auto subCtx = LocationContext::fromBindings(sub.locations);
    auto superCtx = LocationContext::fromBindings(super.locations);
    if (!subCtx || !superCtx || !engine.isSubcontext(subCtx.value(), superCtx.value()))
        return false;

    const LifetimeState subState = LifetimeState::fromNodeType(sub);
    const LifetimeState superState = LifetimeState::fromNodeType(super);
    if (subState.active != superState.active)
        return false;
    return subState.bounds.firstUnentailed(superState.bounds) == nullptr;
}

} // namespace tsir::verify
