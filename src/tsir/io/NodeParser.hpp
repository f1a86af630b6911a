//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/io/NodeParser.hpp
// Purpose: Parse node types and node statements of a function body.
// Key invariants: A node statement occupies the rest of its line.
// Ownership/Lifetime: Stateless helpers.
// Links: docs/tsir-format.md#nodes
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "tsir/core/Node.hpp"
#include "tsir/core/NodeType.hpp"
#include "tsir/io/ParserState.hpp"
#include "tsir/parse/Cursor.h"

namespace tsir::io::detail
{

/// @brief `[bindings; lifetimes; bounds]`.
support::Expected<core::NodeType> parseNodeType(tsir::parse::Cursor &cur, const ParserState &st);

/// @brief One of assign, call, if, switch, drop, begin, end, unreachable.
support::Expected<core::Node> parseNode(tsir::parse::Cursor &cur, const ParserState &st);

} // namespace tsir::io::detail
