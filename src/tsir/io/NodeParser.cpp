//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/io/NodeParser.cpp
// Purpose: Implement parsing of node types and node statements.
// Key invariants: Every parsed node records the line it came from.
// Links: docs/tsir-format.md#nodes
//
//===----------------------------------------------------------------------===//

#include "tsir/io/NodeParser.hpp"

#include "tsir/io/TypeParser.hpp"

#include <array>
#include <string_view>
#include <utility>

namespace tsir::io::detail
{
namespace
{
using core::Node;

/// Parse `-> label` into @p out.
Expected<void> parseTarget(Cursor &cur, const ParserState &st, std::string &out)
{
    if (!cur.consumePunct("->"))
        return fail<void>(cur, st, "expected '->'");
    auto label = parseLabel(cur, st);
    if (!label)
        return Expected<void>{label.error()};
    out = std::move(label.value());
    return {};
}

Expected<Node> finish(Cursor &cur, const ParserState &st, core::NodeKind kind, size_t column)
{
    if (auto end = expectEnd(cur, st); !end)
        return Expected<Node>{end.error()};
    return Node{std::move(kind), st.loc(column)};
}

Expected<core::Rvalue> parseRvalue(Cursor &cur, const ParserState &st)
{
    core::Rvalue rv;
    const size_t start = cur.offset();
    std::string_view name;
    if (!cur.peekKeyword("const") && !cur.peekKeyword("ret") && cur.consumeIdent(name))
    {
        if (!cur.consumeIf('('))
            return fail<core::Rvalue>(cur, st, "expected '(' after primop name");
        rv.op = std::string(name);
        do
        {
            auto op = parseOperand(cur, st);
            if (!op)
                return Expected<core::Rvalue>{op.error()};
            rv.operands.push_back(std::move(op.value()));
        } while (cur.consumeIf(','));
        if (auto close = expectChar(cur, st, ')'); !close)
            return Expected<core::Rvalue>{close.error()};
        if (rv.operands.size() > 2)
            return fail<core::Rvalue>(cur, st, "primop takes at most two operands");
        rv.kind = rv.operands.size() == 1 ? core::Rvalue::Kind::Unary : core::Rvalue::Kind::Binary;
        return rv;
    }

    cur.seek(start);
    auto op = parseOperand(cur, st);
    if (!op)
        return Expected<core::Rvalue>{op.error()};
    rv.kind = core::Rvalue::Kind::Use;
    rv.operands.push_back(std::move(op.value()));
    return rv;
}

/// Shared `LOC =` prefix of assign and call.
Expected<core::Location> parseDest(Cursor &cur, const ParserState &st)
{
    auto dest = parseLocation(cur, st);
    if (!dest)
        return dest;
    if (!cur.consumeIf('='))
        return fail<core::Location>(cur, st, "expected '='");
    return dest;
}

Expected<Node> parseAssign(Cursor &cur, const ParserState &st, size_t column)
{
    core::AssignNode node;
    auto dest = parseDest(cur, st);
    if (!dest)
        return Expected<Node>{dest.error()};
    node.dest = std::move(dest.value());
    auto rv = parseRvalue(cur, st);
    if (!rv)
        return Expected<Node>{rv.error()};
    node.value = std::move(rv.value());
    if (auto target = parseTarget(cur, st, node.next); !target)
        return Expected<Node>{target.error()};
    return finish(cur, st, std::move(node), column);
}

Expected<Node> parseCall(Cursor &cur, const ParserState &st, size_t column)
{
    core::CallNode node;
    auto dest = parseDest(cur, st);
    if (!dest)
        return Expected<Node>{dest.error()};
    node.dest = std::move(dest.value());

    cur.consumeIf('@');
    std::string_view callee;
    if (!cur.consumeIdent(callee))
        return fail<Node>(cur, st, "expected callee name");
    node.callee = std::string(callee);
    if (auto args = parseGenericArgs(cur, st, node.lifetimeArgs, node.typeArgs); !args)
        return Expected<Node>{args.error()};

    if (auto open = expectChar(cur, st, '('); !open)
        return Expected<Node>{open.error()};
    if (!cur.consumeIf(')'))
    {
        do
        {
            auto op = parseOperand(cur, st);
            if (!op)
                return Expected<Node>{op.error()};
            node.args.push_back(std::move(op.value()));
        } while (cur.consumeIf(','));
        if (auto close = expectChar(cur, st, ')'); !close)
            return Expected<Node>{close.error()};
    }
    if (auto target = parseTarget(cur, st, node.next); !target)
        return Expected<Node>{target.error()};
    return finish(cur, st, std::move(node), column);
}

Expected<Node> parseIf(Cursor &cur, const ParserState &st, size_t column)
{
    core::IfNode node;
    auto cond = parseOperand(cur, st);
    if (!cond)
        return Expected<Node>{cond.error()};
    node.cond = std::move(cond.value());
    if (auto target = parseTarget(cur, st, node.thenLabel); !target)
        return Expected<Node>{target.error()};
    if (auto comma = expectChar(cur, st, ','); !comma)
        return Expected<Node>{comma.error()};
    auto other = parseLabel(cur, st);
    if (!other)
        return Expected<Node>{other.error()};
    node.elseLabel = std::move(other.value());
    return finish(cur, st, std::move(node), column);
}

Expected<Node> parseSwitch(Cursor &cur, const ParserState &st, size_t column)
{
    core::SwitchNode node;
    auto scrutinee = parseLocation(cur, st);
    if (!scrutinee)
        return Expected<Node>{scrutinee.error()};
    node.scrutinee = std::move(scrutinee.value());
    if (auto colon = expectChar(cur, st, ':'); !colon)
        return Expected<Node>{colon.error()};
    auto staticType = parseType(cur, st);
    if (!staticType)
        return Expected<Node>{staticType.error()};
    node.staticType = std::move(staticType.value());

    if (auto open = expectChar(cur, st, '{'); !open)
        return Expected<Node>{open.error()};
    if (!cur.consumeIf('}'))
    {
        do
        {
            core::SwitchArm arm;
            auto ty = parseType(cur, st);
            if (!ty)
                return Expected<Node>{ty.error()};
            arm.type = std::move(ty.value());
            if (auto target = parseTarget(cur, st, arm.label); !target)
                return Expected<Node>{target.error()};
            node.arms.push_back(std::move(arm));
        } while (cur.consumeIf(','));
        if (auto close = expectChar(cur, st, '}'); !close)
            return Expected<Node>{close.error()};
    }
    return finish(cur, st, std::move(node), column);
}

Expected<Node> parseDrop(Cursor &cur, const ParserState &st, size_t column)
{
    core::DropNode node;
    auto target = parseLocation(cur, st);
    if (!target)
        return Expected<Node>{target.error()};
    node.target = std::move(target.value());
    if (auto next = parseTarget(cur, st, node.next); !next)
        return Expected<Node>{next.error()};
    return finish(cur, st, std::move(node), column);
}

template <class LifetimeNode>
Expected<Node> parseLifetimeNode(Cursor &cur, const ParserState &st, size_t column)
{
    LifetimeNode node;
    auto lt = parseLifetime(cur, st);
    if (!lt)
        return Expected<Node>{lt.error()};
    node.lifetime = std::move(lt.value());
    if (auto next = parseTarget(cur, st, node.next); !next)
        return Expected<Node>{next.error()};
    return finish(cur, st, std::move(node), column);
}

Expected<Node> parseUnreachable(Cursor &cur, const ParserState &st, size_t column)
{
    return finish(cur, st, core::DeadCodeNode{}, column);
}

} // namespace

Expected<core::NodeType> parseNodeType(Cursor &cur, const ParserState &st)
{
    core::NodeType type;
    if (auto open = expectChar(cur, st, '['); !open)
        return Expected<core::NodeType>{open.error()};

    if (cur.peek() != ';')
    {
        do
        {
            auto loc = parseLocation(cur, st);
            if (!loc)
                return Expected<core::NodeType>{loc.error()};
            if (auto colon = expectChar(cur, st, ':'); !colon)
                return Expected<core::NodeType>{colon.error()};
            auto ty = parseType(cur, st);
            if (!ty)
                return Expected<core::NodeType>{ty.error()};
            type.locations.push_back({std::move(loc.value()), std::move(ty.value())});
        } while (cur.consumeIf(','));
    }
    if (auto semi = expectChar(cur, st, ';'); !semi)
        return Expected<core::NodeType>{semi.error()};

    if (cur.peek() != ';')
    {
        do
        {
            auto lt = parseLifetime(cur, st);
            if (!lt)
                return Expected<core::NodeType>{lt.error()};
            type.lifetimes.push_back(std::move(lt.value()));
        } while (cur.consumeIf(','));
    }
    if (auto semi = expectChar(cur, st, ';'); !semi)
        return Expected<core::NodeType>{semi.error()};

    if (cur.peek() != ']')
    {
        do
        {
            auto fact = parseOutlives(cur, st);
            if (!fact)
                return Expected<core::NodeType>{fact.error()};
            type.bounds.push_back(std::move(fact.value()));
        } while (cur.consumeIf(','));
    }
    if (auto close = expectChar(cur, st, ']'); !close)
        return Expected<core::NodeType>{close.error()};
    return type;
}

Expected<Node> parseNode(Cursor &cur, const ParserState &st)
{
    using Handler = Expected<Node> (*)(Cursor &, const ParserState &, size_t);

    struct Dispatch
    {
        std::string_view keyword;
        Handler handler;
    };

    static constexpr std::array<Dispatch, 8> kDispatchTable = {{
        Dispatch{"assign", &parseAssign},
        Dispatch{"call", &parseCall},
        Dispatch{"if", &parseIf},
        Dispatch{"switch", &parseSwitch},
        Dispatch{"drop", &parseDrop},
        Dispatch{"begin", &parseLifetimeNode<core::LifetimeBeginNode>},
        Dispatch{"end", &parseLifetimeNode<core::LifetimeEndNode>},
        Dispatch{"unreachable", &parseUnreachable},
    }};

    cur.skipWs();
    const size_t column = cur.column();
    for (const auto &entry : kDispatchTable)
    {
        if (cur.consumeKeyword(entry.keyword))
            return entry.handler(cur, st, column);
    }
    return fail<Node>(cur, st, "unknown node '" + std::string(cur.remaining()) + "'");
}

} // namespace tsir::io::detail
