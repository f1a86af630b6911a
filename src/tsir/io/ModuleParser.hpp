//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/io/ModuleParser.hpp
// Purpose: Dispatch top-level .tsir declarations.
// Key invariants: The `tsir` version banner precedes every other declaration.
// Ownership/Lifetime: Appends to the Program referenced by ParserState.
// Links: docs/tsir-format.md#declarations
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "tsir/io/ParserState.hpp"

#include <istream>
#include <string>

namespace tsir::io::detail
{

/// @brief Parse the top-level declaration on @p line; `fn` bodies continue
///        reading from @p is.
support::Expected<void> parseModuleHeader_E(std::istream &is,
                                            const std::string &line,
                                            ParserState &st);

} // namespace tsir::io::detail
