//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/io/TypeParser.hpp
// Purpose: Parsers for the shared sub-grammars of .tsir text: lifetimes,
//          types, locations, operands, generic lists and bounds.
// Key invariants: An identifier parses as a type parameter only when it names
//                 a parameter of the signature being parsed.
// Ownership/Lifetime: Stateless helpers operating on a caller-owned cursor.
// Links: docs/tsir-format.md#types
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "tsir/core/Bound.hpp"
#include "tsir/core/Function.hpp"
#include "tsir/core/Lifetime.hpp"
#include "tsir/core/Location.hpp"
#include "tsir/core/Node.hpp"
#include "tsir/core/Type.hpp"
#include "tsir/io/ParserState.hpp"
#include "tsir/io/ParserUtil.hpp"
#include "tsir/parse/Cursor.h"

#include <string>
#include <string_view>
#include <vector>

namespace tsir::io::detail
{

using support::Expected;
using tsir::parse::Cursor;

/// @brief Error at the cursor's column on the current line.
template <class T> Expected<T> fail(const Cursor &cur, const ParserState &st, std::string_view msg)
{
    return Expected<T>{support::makeError(st.loc(cur.column()), formatLineDiag(st.lineNo, msg))};
}

/// @brief Report trailing text after a complete declaration or node.
Expected<void> expectEnd(Cursor &cur, const ParserState &st);

/// @brief Consume @p c or fail with "expected 'c'".
Expected<void> expectChar(Cursor &cur, const ParserState &st, char c);

/// @brief `'name`, `'static` or `'_`.
Expected<core::Lifetime> parseLifetime(Cursor &cur, const ParserState &st);

/// @brief `!`, `uninit<N>`, a type parameter or `Name<'l.., T..>`.
Expected<core::Type> parseType(Cursor &cur, const ParserState &st);

/// @brief `ret`, `@name`, `%name` or `$name`.
Expected<core::Location> parseLocation(Cursor &cur, const ParserState &st);

/// @brief A location or `const TYPE`.
Expected<core::Operand> parseOperand(Cursor &cur, const ParserState &st);

/// @brief Parse `<'a, T, ...>` when present; lifetimes and types are
///        collected in order into separate lists.
Expected<void> parseGenericArgs(Cursor &cur,
                                const ParserState &st,
                                std::vector<core::Lifetime> &lifetimes,
                                std::vector<core::Type> &types);

/// @brief Parse `<'a, T[8]>` when present and make the type parameters visible.
Expected<void> parseGenericParams(Cursor &cur, ParserState &st, core::Generics &generics);

/// @brief `'a: 'b` or `T: 'a`.
Expected<core::Outlives> parseOutlives(Cursor &cur, const ParserState &st);

/// @brief Parse `where B, B, ...` when present; B is an outlives fact or `T: Trait`.
Expected<void> parseWhereClause(Cursor &cur, const ParserState &st, core::Generics &generics);

/// @brief Label identifier.
Expected<std::string> parseLabel(Cursor &cur, const ParserState &st);

} // namespace tsir::io::detail
