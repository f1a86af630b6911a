//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/io/TypeParser.cpp
// Purpose: Implement the shared sub-grammars of .tsir text.
// Key invariants: Lifetime arguments and type arguments may be written in any
//                 order inside `<...>`; each list keeps its relative order.
// Links: docs/tsir-format.md#types
//
//===----------------------------------------------------------------------===//

#include "tsir/io/TypeParser.hpp"

#include "tsir/io/ParserUtil.hpp"

#include <utility>

namespace tsir::io::detail
{

using core::Lifetime;
using core::Location;
using core::Type;

Expected<void> expectEnd(Cursor &cur, const ParserState &st)
{
    if (cur.atEnd())
        return {};
    return fail<void>(cur, st, "unexpected '" + std::string(cur.remaining()) + "'");
}

Expected<void> expectChar(Cursor &cur, const ParserState &st, char c)
{
    if (cur.consumeIf(c))
        return {};
    return fail<void>(cur, st, std::string("expected '") + c + "'");
}

Expected<Lifetime> parseLifetime(Cursor &cur, const ParserState &st)
{
    if (!cur.consumeIf('\''))
        return fail<Lifetime>(cur, st, "expected lifetime");
    std::string_view name;
    if (!cur.consumeIdent(name))
        return fail<Lifetime>(cur, st, "expected lifetime name");
    if (name == "static")
        return Lifetime::staticLifetime();
    if (name == "_")
        return Lifetime::wildcard();
    return Lifetime::named(std::string(name));
}

Expected<Type> parseType(Cursor &cur, const ParserState &st)
{
    if (cur.consumeIf('!'))
        return Type::absurd();

    std::string_view name;
    if (!cur.consumeIdent(name))
        return fail<Type>(cur, st, "expected type");

    if (name == "uninit")
    {
        uint64_t size = 0;
        if (!cur.consumeIf('<') || !cur.consumeNumber(size) || !cur.consumeIf('>'))
            return fail<Type>(cur, st, "malformed uninit type, expected uninit<N>");
        return Type::uninit(size);
    }

    if (cur.peek() != '<')
    {
        if (st.typeParams.count(std::string(name)))
            return Type::param(std::string(name));
        return Type::user(std::string(name));
    }

    Type ty = Type::user(std::string(name));
    if (auto result = parseGenericArgs(cur, st, ty.lifetimeArgs, ty.typeArgs); !result)
        return Expected<Type>{result.error()};
    return ty;
}

Expected<Location> parseLocation(Cursor &cur, const ParserState &st)
{
    if (cur.consumeKeyword("ret"))
        return Location::returnSlot();

    const char sigil = cur.peek();
    if (sigil != '@' && sigil != '%' && sigil != '$')
        return fail<Location>(cur, st, "expected location");
    cur.consumeIf(sigil);

    std::string_view name;
    if (!cur.consumeIdent(name))
        return fail<Location>(cur, st, "expected location name");
    switch (sigil)
    {
        case '@':
            return Location::staticVar(std::string(name));
        case '%':
            return Location::local(std::string(name));
        default:
            return Location::param(std::string(name));
    }
}

Expected<core::Operand> parseOperand(Cursor &cur, const ParserState &st)
{
    if (cur.consumeKeyword("const"))
    {
        auto ty = parseType(cur, st);
        if (!ty)
            return Expected<core::Operand>{ty.error()};
        return core::Operand::constant(std::move(ty.value()));
    }
    auto loc = parseLocation(cur, st);
    if (!loc)
        return Expected<core::Operand>{loc.error()};
    return core::Operand::use(std::move(loc.value()));
}

Expected<void> parseGenericArgs(Cursor &cur,
                                const ParserState &st,
                                std::vector<Lifetime> &lifetimes,
                                std::vector<Type> &types)
{
    if (!cur.consumeIf('<'))
        return {};
    if (cur.consumeIf('>'))
        return {};
    do
    {
        if (cur.peek() == '\'')
        {
            auto lt = parseLifetime(cur, st);
            if (!lt)
                return Expected<void>{lt.error()};
            lifetimes.push_back(std::move(lt.value()));
        }
        else
        {
            auto ty = parseType(cur, st);
            if (!ty)
                return Expected<void>{ty.error()};
            types.push_back(std::move(ty.value()));
        }
    } while (cur.consumeIf(','));
    return expectChar(cur, st, '>');
}

Expected<void> parseGenericParams(Cursor &cur, ParserState &st, core::Generics &generics)
{
    if (!cur.consumeIf('<'))
        return {};
    do
    {
        if (cur.peek() == '\'')
        {
            auto lt = parseLifetime(cur, st);
            if (!lt)
                return Expected<void>{lt.error()};
            if (lt.value().kind != Lifetime::Kind::Named)
                return fail<void>(cur, st, "cannot declare lifetime parameter " +
                                               lt.value().toString());
            generics.lifetimes.push_back(std::move(lt.value()));
            continue;
        }
        std::string_view name;
        if (!cur.consumeIdent(name))
            return fail<void>(cur, st, "expected generic parameter");
        uint64_t size = 0;
        if (!cur.consumeIf('[') || !cur.consumeNumber(size) || !cur.consumeIf(']'))
            return fail<void>(cur, st,
                              "type parameter '" + std::string(name) + "' needs a size, e.g. " +
                                  std::string(name) + "[8]");
        generics.types.push_back(core::TypeParam{std::string(name), size});
        st.typeParams.insert(std::string(name));
    } while (cur.consumeIf(','));
    return expectChar(cur, st, '>');
}

Expected<core::Outlives> parseOutlives(Cursor &cur, const ParserState &st)
{
    if (cur.peek() == '\'')
    {
        auto longer = parseLifetime(cur, st);
        if (!longer)
            return Expected<core::Outlives>{longer.error()};
        if (auto colon = expectChar(cur, st, ':'); !colon)
            return Expected<core::Outlives>{colon.error()};
        auto shorter = parseLifetime(cur, st);
        if (!shorter)
            return Expected<core::Outlives>{shorter.error()};
        return core::Outlives::lifetimes(std::move(longer.value()), std::move(shorter.value()));
    }

    auto ty = parseType(cur, st);
    if (!ty)
        return Expected<core::Outlives>{ty.error()};
    if (auto colon = expectChar(cur, st, ':'); !colon)
        return Expected<core::Outlives>{colon.error()};
    auto shorter = parseLifetime(cur, st);
    if (!shorter)
        return Expected<core::Outlives>{shorter.error()};
    return core::Outlives::typeOutlives(std::move(ty.value()), std::move(shorter.value()));
}

Expected<void> parseWhereClause(Cursor &cur, const ParserState &st, core::Generics &generics)
{
    if (!cur.consumeKeyword("where"))
        return {};
    do
    {
        if (cur.peek() == '\'')
        {
            auto fact = parseOutlives(cur, st);
            if (!fact)
                return Expected<void>{fact.error()};
            generics.outlives.push_back(std::move(fact.value()));
            continue;
        }

        auto ty = parseType(cur, st);
        if (!ty)
            return Expected<void>{ty.error()};
        if (auto colon = expectChar(cur, st, ':'); !colon)
            return colon;
        if (cur.peek() == '\'')
        {
            auto shorter = parseLifetime(cur, st);
            if (!shorter)
                return Expected<void>{shorter.error()};
            generics.outlives.push_back(
                core::Outlives::typeOutlives(std::move(ty.value()), std::move(shorter.value())));
            continue;
        }
        std::string_view trait;
        if (!cur.consumeIdent(trait))
            return fail<void>(cur, st, "expected trait name or lifetime");
        generics.traitBounds.push_back(core::TraitBound{std::move(ty.value()), std::string(trait)});
    } while (cur.consumeIf(','));
    return {};
}

Expected<std::string> parseLabel(Cursor &cur, const ParserState &st)
{
    std::string_view name;
    if (!cur.consumeIdent(name))
        return fail<std::string>(cur, st, "expected label");
    return std::string(name);
}

} // namespace tsir::io::detail
