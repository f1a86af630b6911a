//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/io/ParserState.hpp
// Purpose: Mutable state threaded through the .tsir parsing helpers.
// Key invariants: `lineNo` is the 1-based number of the last line read.
// Ownership/Lifetime: References the Program being populated; lives for one
//                     Parser::parse call.
// Links: docs/tsir-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include "tsir/core/Program.hpp"

#include <cstdint>
#include <set>
#include <string>

namespace tsir::io::detail
{

struct ParserState
{
    explicit ParserState(core::Program &program, uint32_t fileId = 0);

    core::Program &program;
    uint32_t fileId = 0;
    unsigned lineNo = 0;
    bool sawVersion = false;

    /// Type parameter names visible while parsing the current signature.
    std::set<std::string> typeParams;

    /// @brief Source location of column @p column on the current line.
    support::SourceLoc loc(size_t column = 1) const;
};

} // namespace tsir::io::detail
