//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/io/ParserUtil.hpp
// Purpose: Declare small string helpers shared by the .tsir parsers.
// Key invariants: Diagnostics are formatted as `line N: message`.
// Ownership/Lifetime: Stateless free functions.
// Links: docs/tsir-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>

namespace tsir::io
{

/// @brief Remove leading and trailing blanks.
std::string trim(const std::string &text);

/// @brief Drop a trailing `#` comment.
std::string stripComment(const std::string &text);

/// @brief Prefix @p message with the line number.
std::string formatLineDiag(unsigned lineNo, std::string_view message);

/// @brief Build an error Expected carrying a `line N:` diagnostic.
template <class T>
support::Expected<T> lineError(support::SourceLoc loc, unsigned lineNo, std::string_view message)
{
    return support::Expected<T>{support::makeError(loc, formatLineDiag(lineNo, message))};
}

} // namespace tsir::io
