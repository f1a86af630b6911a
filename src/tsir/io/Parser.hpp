//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Parser class, which reads .tsir source text and builds
// a Program: the global context store, statics, externs and the node graphs of
// every defined function. The grammar is documented in docs/tsir-format.md.
//
// The parser only checks syntax. Ordering rules of the context store, label
// resolution and every typestate rule are left to the verifier so that a
// well-formed but ill-typed program still parses.
//
// Usage Example:
//   std::ifstream file("program.tsir");
//   tsir::core::Program program;
//   if (auto result = tsir::io::Parser::parse(file, program); !result) {
//     tsir::support::printDiag(result.error(), std::cerr);
//     return 1;
//   }
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "tsir/core/fwd.hpp"

#include <cstdint>
#include <istream>

namespace tsir::io
{

/// @brief Hand-rolled line-oriented parser for .tsir programs.
class Parser
{
  public:
    /// @brief Parse a program from stream into @p program.
    /// @param fileId Source manager id stamped on every parsed location.
    /// @return Expected success or the first syntax error.
    [[nodiscard]] static support::Expected<void> parse(std::istream &is,
                                                       core::Program &program,
                                                       uint32_t fileId = 0);
};

} // namespace tsir::io
