//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/LocationContext.cpp
// Purpose: Implement location contexts and the move/copy/write/drop engine.
// Key invariants: Every engine operation returns a fresh context and leaves
//                 its input untouched.
// Links: docs/tsir-verifier.md#contexts
//
//===----------------------------------------------------------------------===//

#include "tsir/verify/LocationContext.hpp"

#include <sstream>
#include <utility>

namespace tsir::verify
{

using core::Location;
using core::Type;

VResult<LocationContext> LocationContext::fromBindings(
    const std::vector<core::LocationBinding> &bindings)
{
    LocationContext ctx;
    for (const auto &binding : bindings)
    {
        if (!ctx.slots_.emplace(binding.loc, binding.type).second)
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 "location " + binding.loc.toString() + " listed twice",
                                 {binding.loc});
    }
    return ctx;
}

const Type *LocationContext::find(const Location &loc) const
{
    auto it = slots_.find(loc);
    return it == slots_.end() ? nullptr : &it->second;
}

void LocationContext::set(const Location &loc, Type type)
{
    slots_[loc] = std::move(type);
}

bool LocationContext::hasAbsurd() const
{
    for (const auto &[loc, type] : slots_)
    {
        if (type.isAbsurd())
            return true;
    }
    return false;
}

std::vector<Location> LocationContext::locationsMentioning(const core::Lifetime &lt) const
{
    std::vector<Location> out;
    for (const auto &[loc, type] : slots_)
    {
        if (type.mentions(lt))
            out.push_back(loc);
    }
    return out;
}

std::string LocationContext::toString() const
{
    std::ostringstream os;
    os << '[';
    bool first = true;
    for (const auto &[loc, type] : slots_)
    {
        if (!first)
            os << ", ";
        first = false;
        os << loc.toString() << ": " << type.toString();
    }
    os << ']';
    return os.str();
}

VResult<Consumed> ContextEngine::consume(const Location &loc, const LocationContext &ctx) const
{
    const auto &types = relations_.types();
    if (loc.isStatic())
    {
        const Type *type = statics_.find(loc);
        if (!type)
            return makeViolation(
                VerifyDiagCode::MalformedContext, "unknown static " + loc.toString(), {loc});
        if (!types.isCopy(*type))
            return makeViolation(VerifyDiagCode::TypeMismatch,
                                 "cannot move non-Copy " + type->toString() + " out of static " +
                                     loc.toString(),
                                 {loc});
        return Consumed{*type, ctx};
    }

    const Type *type = ctx.find(loc);
    if (!type)
        return makeViolation(
            VerifyDiagCode::MalformedContext, loc.toString() + " is not in the context", {loc});
    if (type->isUninit())
        return makeViolation(
            VerifyDiagCode::UseAfterMove, "use of uninitialized " + loc.toString(), {loc});
    if (types.isCopy(*type))
        return Consumed{*type, ctx};

    const auto size = types.sizeOf(*type);
    if (!size)
        return makeViolation(VerifyDiagCode::MalformedContext,
                             "type " + type->toString() + " has no known size",
                             {loc});
    Consumed out{*type, ctx};
    out.ctx.set(loc, Type::uninit(*size));
    return out;
}

VResult<Consumed> ContextEngine::operand(const core::Operand &op, const LocationContext &ctx) const
{
    if (op.kind == core::Operand::Kind::Use)
        return consume(op.loc, ctx);

    if (auto wf = relations_.types().checkWellFormed(op.type); !wf)
        return makeViolation(VerifyDiagCode::MalformedContext, wf.error().message);
    if (op.type.isUninit())
        return makeViolation(VerifyDiagCode::TypeMismatch, "constant of uninitialized type");
    if (op.type.isAbsurd())
        return makeViolation(VerifyDiagCode::TypeMismatch, "constant of absurd type !");
    return Consumed{op.type, ctx};
}

CheckResult ContextEngine::requireUninit(const Location &loc, const LocationContext &ctx) const
{
    if (loc.isStatic())
        return makeViolation(
            VerifyDiagCode::TypeMismatch, "cannot write static " + loc.toString(), {loc});
    const Type *cur = ctx.find(loc);
    if (!cur)
        return makeViolation(
            VerifyDiagCode::MalformedContext, loc.toString() + " is not in the context", {loc});
    if (!cur->isUninit())
        return makeViolation(VerifyDiagCode::DoubleInit,
                             loc.toString() + " already holds " + cur->toString(),
                             {loc});
    return {};
}

VResult<LocationContext> ContextEngine::assign(const Location &loc,
                                               const Type &type,
                                               const LocationContext &ctx) const
{
    if (auto result = requireUninit(loc, ctx); !result)
        return result.error();

    const uint64_t slotSize = ctx.find(loc)->size;
    if (!type.isAbsurd())
    {
        const auto size = relations_.types().sizeOf(type);
        if (!size)
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 "type " + type.toString() + " has no known size",
                                 {loc});
        if (*size != slotSize)
            return makeViolation(VerifyDiagCode::MalformedContext,
                                 "cannot store " + type.toString() + " (size " +
                                     std::to_string(*size) + ") in " + loc.toString() +
                                     " (size " + std::to_string(slotSize) + ")",
                                 {loc});
    }

    LocationContext out = ctx;
    out.set(loc, type);
    return out;
}

VResult<LocationContext> ContextEngine::drop(const Location &loc, const LocationContext &ctx) const
{
    if (loc.isStatic())
        return makeViolation(
            VerifyDiagCode::TypeMismatch, "cannot drop static " + loc.toString(), {loc});
    const Type *type = ctx.find(loc);
    if (!type)
        return makeViolation(
            VerifyDiagCode::MalformedContext, loc.toString() + " is not in the context", {loc});
    if (type->isUninit())
        return makeViolation(
            VerifyDiagCode::UseAfterMove, "drop of uninitialized " + loc.toString(), {loc});

    const auto &types = relations_.types();
    if (!types.isCopy(*type))
        return makeViolation(VerifyDiagCode::TypeMismatch,
                             "cannot drop non-Copy " + type->toString() + " in " + loc.toString(),
                             {loc});
    const auto size = types.sizeOf(*type);
    if (!size)
        return makeViolation(VerifyDiagCode::MalformedContext,
                             "type " + type->toString() + " has no known size",
                             {loc});

    LocationContext out = ctx;
    out.set(loc, Type::uninit(*size));
    return out;
}

CheckResult ContextEngine::equalsRequired(const LocationContext &actual,
                                          const LocationContext &required) const
{
    if (actual.hasAbsurd())
        return {};

    for (const auto &[loc, want] : required)
    {
        const Type *have = actual.find(loc);
        if (!have)
        {
            Violation v = makeViolation(
                VerifyDiagCode::MalformedContext, loc.toString() + " missing from context", {loc});
            v.expected = required.toString();
            v.actual = actual.toString();
            return v;
        }
        if (!relations_.isSubtype(*have, want))
        {
            Violation v = makeViolation(VerifyDiagCode::TypeMismatch,
                                        loc.toString() + ": " + have->toString() +
                                            " is not a subtype of " + want.toString(),
                                        {loc});
            v.expected = required.toString();
            v.actual = actual.toString();
            return v;
        }
    }
    for (const auto &[loc, have] : actual)
    {
        if (!required.contains(loc))
        {
            Violation v = makeViolation(VerifyDiagCode::MalformedContext,
                                        loc.toString() + " not declared at successor",
                                        {loc});
            v.expected = required.toString();
            v.actual = actual.toString();
            return v;
        }
    }
    return {};
}

bool ContextEngine::isSubcontext(const LocationContext &sub, const LocationContext &super) const
{
    if (sub.size() != super.size())
        return false;
    for (const auto &[loc, want] : super)
    {
        const Type *have = sub.find(loc);
        if (!have || !relations_.isSubtype(*have, want))
            return false;
    }
    return true;
}

} // namespace tsir::verify
