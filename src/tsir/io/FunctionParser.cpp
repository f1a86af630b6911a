//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/io/FunctionParser.cpp
// Purpose: Implement signature and function body parsing.
// Key invariants: A label line is `name: [node type]`, optionally followed on
//                 the same line by its node; otherwise the node is the next
//                 non-blank line.
// Links: docs/tsir-format.md#functions
//
//===----------------------------------------------------------------------===//

#include "tsir/io/FunctionParser.hpp"

#include "tsir/io/NodeParser.hpp"
#include "tsir/io/ParserUtil.hpp"
#include "tsir/io/TypeParser.hpp"

#include <optional>
#include <utility>

namespace tsir::io::detail
{
namespace
{
/// Read the next non-blank, comment-stripped line; leading blanks are kept so
/// node columns match the source.
bool nextLine(std::istream &is, ParserState &st, std::string &out)
{
    std::string raw;
    while (std::getline(is, raw))
    {
        ++st.lineNo;
        out = stripComment(raw);
        out.erase(out.find_last_not_of(" \t\r\n") + 1);
        if (!trim(out).empty())
            return true;
    }
    return false;
}

/// Parse `locals %a, %b` (commas optional).
Expected<void> parseLocals(Cursor &cur, const ParserState &st, core::Function &fn)
{
    while (!cur.atEnd())
    {
        auto loc = parseLocation(cur, st);
        if (!loc)
            return Expected<void>{loc.error()};
        if (loc.value().kind != core::Location::Kind::Local)
            return fail<void>(cur, st, "locals must be written %name");
        fn.locals.push_back(std::move(loc.value()));
        cur.consumeIf(',');
    }
    return {};
}
} // namespace

Expected<void> parseSignature(Cursor &cur,
                              ParserState &st,
                              bool withSlots,
                              core::FunctionSig &sig,
                              std::vector<core::Param> &params)
{
    cur.consumeIf('@');
    std::string_view name;
    if (!cur.consumeIdent(name))
        return fail<void>(cur, st, "expected function name");
    sig.name = std::string(name);
    sig.loc = st.loc(cur.column());

    if (auto generics = parseGenericParams(cur, st, sig.generics); !generics)
        return generics;

    if (auto open = expectChar(cur, st, '('); !open)
        return open;
    if (!cur.consumeIf(')'))
    {
        do
        {
            std::optional<core::Location> slot;
            if (withSlots)
            {
                auto loc = parseLocation(cur, st);
                if (!loc)
                    return Expected<void>{loc.error()};
                if (loc.value().kind != core::Location::Kind::Param)
                    return fail<void>(cur, st, "parameters must be written $name");
                if (auto colon = expectChar(cur, st, ':'); !colon)
                    return colon;
                slot = std::move(loc.value());
            }
            auto ty = parseType(cur, st);
            if (!ty)
                return Expected<void>{ty.error()};
            if (slot)
                params.push_back(core::Param{std::move(*slot), ty.value()});
            sig.params.push_back(std::move(ty.value()));
        } while (cur.consumeIf(','));
        if (auto close = expectChar(cur, st, ')'); !close)
            return close;
    }

    if (!cur.consumePunct("->"))
        return fail<void>(cur, st, "expected '->' before return type");
    auto ret = parseType(cur, st);
    if (!ret)
        return Expected<void>{ret.error()};
    sig.ret = std::move(ret.value());

    return parseWhereClause(cur, st, sig.generics);
}

Expected<void> parseFunction(std::istream &is, const std::string &header, ParserState &st)
{
    st.typeParams.clear();
    core::Function fn;
    core::FunctionSig sig;
    Cursor cur(header);
    cur.consumeKeyword("fn");
    if (auto result = parseSignature(cur, st, true, sig, fn.params); !result)
        return result;
    if (auto open = expectChar(cur, st, '{'); !open)
        return open;
    if (auto end = expectEnd(cur, st); !end)
        return end;

    fn.name = sig.name;
    fn.generics = std::move(sig.generics);
    fn.retType = std::move(sig.ret);
    fn.loc = sig.loc;

    std::optional<size_t> pending;
    std::string line;
    while (nextLine(is, st, line))
    {
        Cursor body(line);
        if (trim(line) == "}")
        {
            if (pending)
                return lineError<void>(st.loc(), st.lineNo,
                                       "label '" + fn.nodes[*pending].label + "' has no node");
            st.program.functions.push_back(std::move(fn));
            st.typeParams.clear();
            return {};
        }

        if (pending)
        {
            auto node = parseNode(body, st);
            if (!node)
                return Expected<void>{node.error()};
            fn.nodes[*pending].node = std::move(node.value());
            pending.reset();
            continue;
        }

        if (body.consumeKeyword("locals"))
        {
            if (auto result = parseLocals(body, st, fn); !result)
                return result;
            continue;
        }

        auto label = parseLabel(body, st);
        if (!label)
            return Expected<void>{label.error()};
        if (auto colon = expectChar(body, st, ':'); !colon)
            return colon;
        auto type = parseNodeType(body, st);
        if (!type)
            return Expected<void>{type.error()};

        core::LabeledNode entry{std::move(label.value()), std::move(type.value()), core::Node{}};
        if (body.atEnd())
        {
            fn.nodes.push_back(std::move(entry));
            pending = fn.nodes.size() - 1;
            continue;
        }
        auto node = parseNode(body, st);
        if (!node)
            return Expected<void>{node.error()};
        entry.node = std::move(node.value());
        fn.nodes.push_back(std::move(entry));
    }

    return lineError<void>(
        st.loc(), st.lineNo, "missing '}' at end of function '@" + fn.name + "'");
}

} // namespace tsir::io::detail
