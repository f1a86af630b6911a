//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/io/ParserState.cpp
// Purpose: Out-of-line members of the parser state.
// Links: docs/tsir-format.md
//
//===----------------------------------------------------------------------===//

#include "tsir/io/ParserState.hpp"

namespace tsir::io::detail
{

ParserState::ParserState(core::Program &prog, uint32_t file) : program(prog), fileId(file) {}

support::SourceLoc ParserState::loc(size_t column) const
{
    return {fileId, lineNo, static_cast<uint32_t>(column)};
}

} // namespace tsir::io::detail
