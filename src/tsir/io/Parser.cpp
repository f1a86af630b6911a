//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the façade entry point of the .tsir text parser. Lines are pulled
// one at a time; comments and blank lines are skipped and everything else is
// handed to the module-level dispatcher, which may consume further lines for a
// function body.
//
//===----------------------------------------------------------------------===//

#include "tsir/io/Parser.hpp"

#include "tsir/core/Program.hpp"
#include "tsir/io/ModuleParser.hpp"
#include "tsir/io/ParserState.hpp"
#include "tsir/io/ParserUtil.hpp"

#include <string>

namespace tsir::io
{

support::Expected<void> Parser::parse(std::istream &is, core::Program &program, uint32_t fileId)
{
    detail::ParserState st{program, fileId};
    std::string line;
    while (std::getline(is, line))
    {
        ++st.lineNo;
        if (st.lineNo == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0)
            line.erase(0, 3);
        line = trim(stripComment(line));
        if (line.empty())
            continue;
        if (auto result = detail::parseModuleHeader_E(is, line, st); !result)
            return result;
    }
    if (!st.sawVersion)
        return lineError<void>({}, st.lineNo, "missing 'tsir' version directive");
    return {};
}

} // namespace tsir::io
