//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/io/FunctionParser.hpp
// Purpose: Parse signatures and function bodies.
// Key invariants: A body ends at a line containing only `}`.
// Ownership/Lifetime: Appends to the Program referenced by ParserState.
// Links: docs/tsir-format.md#functions
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "tsir/core/Function.hpp"
#include "tsir/io/ParserState.hpp"
#include "tsir/parse/Cursor.h"

#include <istream>
#include <string>
#include <vector>

namespace tsir::io::detail
{

/// @brief Parse `[@]name<generics>(params) -> ret where ...` into @p sig.
/// @param withSlots True for definitions, whose parameters are `$x: T`.
/// @param params Receives parameter slots when @p withSlots is set.
support::Expected<void> parseSignature(tsir::parse::Cursor &cur,
                                       ParserState &st,
                                       bool withSlots,
                                       core::FunctionSig &sig,
                                       std::vector<core::Param> &params);

/// @brief Parse a `fn` definition whose header is @p header (after `fn`),
///        reading body lines from @p is.
support::Expected<void> parseFunction(std::istream &is, const std::string &header, ParserState &st);

} // namespace tsir::io::detail
