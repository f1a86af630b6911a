//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/io/ParserUtil.cpp
// Purpose: Implement string helpers shared by the .tsir parsers.
// Links: docs/tsir-format.md
//
//===----------------------------------------------------------------------===//

#include "tsir/io/ParserUtil.hpp"

#include <sstream>

namespace tsir::io
{

std::string trim(const std::string &text)
{
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return {};
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string stripComment(const std::string &text)
{
    const auto hash = text.find('#');
    return hash == std::string::npos ? text : text.substr(0, hash);
}

std::string formatLineDiag(unsigned lineNo, std::string_view message)
{
    std::ostringstream oss;
    oss << "line " << lineNo << ": " << message;
    return oss.str();
}

} // namespace tsir::io
