//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/io/ModuleParser.cpp
// Purpose: Implement parsing of the version banner, type, variant, impl,
//          primop, static, extern and fn declarations.
// Key invariants: Declarations are appended to the context store in source
//                 order so ordering rules can be validated later.
// Links: docs/tsir-format.md#declarations
//
//===----------------------------------------------------------------------===//

#include "tsir/io/ModuleParser.hpp"

#include "tsir/core/Program.hpp"
#include "tsir/io/FunctionParser.hpp"
#include "tsir/io/ParserUtil.hpp"
#include "tsir/io/TypeParser.hpp"
#include "tsir/version.hpp"

#include <array>
#include <string_view>
#include <utility>

namespace tsir::io::detail
{
namespace
{
using core::UserTypeDecl;

Expected<void> parseVersion(Cursor &cur, ParserState &st)
{
    if (st.sawVersion)
        return fail<void>(cur, st, "duplicate 'tsir' version directive");
    const std::string version = trim(std::string(cur.remaining()));
    if (version != TSIR_FORMAT_VERSION_STR)
        return fail<void>(cur, st, "unsupported format version '" + version + "'");
    st.program.version = version;
    st.sawVersion = true;
    return {};
}

/// `<'a, T>` on a type declaration: names only.
Expected<void> parseDeclParams(Cursor &cur, const ParserState &st, UserTypeDecl &decl)
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
            if (lt.value().kind != core::Lifetime::Kind::Named)
                return fail<void>(cur, st, "cannot declare lifetime parameter " +
                                               lt.value().toString());
            decl.lifetimeParams.push_back(lt.value().name);
            continue;
        }
        std::string_view name;
        if (!cur.consumeIdent(name))
            return fail<void>(cur, st, "expected type parameter name");
        decl.typeParams.emplace_back(name);
    } while (cur.consumeIf(','));
    return expectChar(cur, st, '>');
}

Expected<void> parseTypeDecl(Cursor &cur, ParserState &st)
{
    UserTypeDecl decl;
    decl.loc = st.loc(cur.column());
    std::string_view name;
    if (!cur.consumeIdent(name))
        return fail<void>(cur, st, "expected type name");
    decl.name = std::string(name);
    if (auto params = parseDeclParams(cur, st, decl); !params)
        return params;
    if (!cur.consumeKeyword("size") || !cur.consumeNumber(decl.size))
        return fail<void>(cur, st, "expected 'size N'");
    if (auto end = expectEnd(cur, st); !end)
        return end;
    st.program.types.addUserType(std::move(decl));
    return {};
}

/// Without explicit parameters a variant takes its parent's; the size is
/// always the parent's.
Expected<void> parseVariantDecl(Cursor &cur, ParserState &st)
{
    UserTypeDecl decl;
    decl.loc = st.loc(cur.column());
    std::string_view name;
    if (!cur.consumeIdent(name))
        return fail<void>(cur, st, "expected variant name");
    decl.name = std::string(name);
    const bool explicitParams = cur.peek() == '<';
    if (auto params = parseDeclParams(cur, st, decl); !params)
        return params;
    std::string_view parent;
    if (!cur.consumeKeyword("of") || !cur.consumeIdent(parent))
        return fail<void>(cur, st, "expected 'of ENUM'");
    if (auto end = expectEnd(cur, st); !end)
        return end;

    decl.parent = std::string(parent);
    if (const UserTypeDecl *enumDecl = st.program.types.findUserType(parent))
    {
        decl.size = enumDecl->size;
        if (!explicitParams)
        {
            decl.lifetimeParams = enumDecl->lifetimeParams;
            decl.typeParams = enumDecl->typeParams;
        }
    }
    st.program.types.addUserType(std::move(decl));
    return {};
}

Expected<void> parseImpl(Cursor &cur, ParserState &st)
{
    const auto loc = st.loc(cur.column());
    std::string_view trait;
    if (!cur.consumeIdent(trait))
        return fail<void>(cur, st, "expected trait name");
    if (!cur.consumeKeyword("for"))
        return fail<void>(cur, st, "expected 'for'");
    auto ty = parseType(cur, st);
    if (!ty)
        return Expected<void>{ty.error()};
    if (auto end = expectEnd(cur, st); !end)
        return end;
    st.program.types.addImpl(core::ImplFact{std::string(trait), std::move(ty.value()), loc});
    return {};
}

Expected<void> parsePrimOp(Cursor &cur, ParserState &st)
{
    core::PrimOpDecl decl;
    decl.loc = st.loc(cur.column());
    std::string_view name;
    if (!cur.consumeIdent(name))
        return fail<void>(cur, st, "expected primop name");
    decl.name = std::string(name);
    if (auto open = expectChar(cur, st, '('); !open)
        return open;
    do
    {
        auto ty = parseType(cur, st);
        if (!ty)
            return Expected<void>{ty.error()};
        decl.params.push_back(std::move(ty.value()));
    } while (cur.consumeIf(','));
    if (auto close = expectChar(cur, st, ')'); !close)
        return close;
    if (!cur.consumePunct("->"))
        return fail<void>(cur, st, "expected '->'");
    auto result = parseType(cur, st);
    if (!result)
        return Expected<void>{result.error()};
    decl.result = std::move(result.value());
    if (auto end = expectEnd(cur, st); !end)
        return end;
    st.program.types.addPrimOp(std::move(decl));
    return {};
}

Expected<void> parseStatic(Cursor &cur, ParserState &st)
{
    core::StaticDecl decl;
    decl.srcLoc = st.loc(cur.column());
    auto loc = parseLocation(cur, st);
    if (!loc)
        return Expected<void>{loc.error()};
    if (!loc.value().isStatic())
        return fail<void>(cur, st, "statics must be written @name");
    decl.loc = std::move(loc.value());
    if (auto colon = expectChar(cur, st, ':'); !colon)
        return colon;
    auto ty = parseType(cur, st);
    if (!ty)
        return Expected<void>{ty.error()};
    decl.type = std::move(ty.value());
    if (auto end = expectEnd(cur, st); !end)
        return end;
    st.program.statics.push_back(std::move(decl));
    return {};
}

Expected<void> parseExtern(Cursor &cur, ParserState &st)
{
    if (!cur.consumeKeyword("fn"))
        return fail<void>(cur, st, "expected 'fn' after 'extern'");
    st.typeParams.clear();
    core::FunctionSig sig;
    std::vector<core::Param> unused;
    if (auto result = parseSignature(cur, st, false, sig, unused); !result)
        return result;
    st.typeParams.clear();
    if (auto end = expectEnd(cur, st); !end)
        return end;
    st.program.externs.push_back(std::move(sig));
    return {};
}

} // namespace

Expected<void> parseModuleHeader_E(std::istream &is, const std::string &line, ParserState &st)
{
    Cursor cur(line);
    if (cur.consumeKeyword("tsir"))
        return parseVersion(cur, st);
    if (!st.sawVersion)
        return lineError<void>(st.loc(), st.lineNo, "missing 'tsir' version directive");

    if (cur.peekKeyword("fn"))
        return parseFunction(is, line, st);

    using Handler = Expected<void> (*)(Cursor &, ParserState &);
    struct Dispatch
    {
        std::string_view keyword;
        Handler handler;
    };
    static constexpr std::array<Dispatch, 6> kDispatchTable = {{
        Dispatch{"type", &parseTypeDecl},
        Dispatch{"variant", &parseVariantDecl},
        Dispatch{"impl", &parseImpl},
        Dispatch{"primop", &parsePrimOp},
        Dispatch{"static", &parseStatic},
        Dispatch{"extern", &parseExtern},
    }};
    for (const auto &entry : kDispatchTable)
    {
        if (cur.consumeKeyword(entry.keyword))
            return entry.handler(cur, st);
    }
    return lineError<void>(st.loc(), st.lineNo, "unexpected line: " + line);
}

} // namespace tsir::io::detail
