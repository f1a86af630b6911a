//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the helpers powering the standalone `tsir-verify` CLI. The entry
// point is factored into a separate unit so tests can drive the whole tool with
// string streams and a custom SourceManager.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/options.hpp"
#include "support/source_manager.hpp"

#include <iosfwd>
#include <string_view>

namespace tsir::tools::verify
{

/// @brief Parse and verify the program at @p path.
/// @param out Stream receiving "OK\n" on success.
/// @param err Stream receiving parse errors, violations and trace notes.
/// @return True when parsing and verification succeed.
bool runVerificationPipeline(std::string_view path,
                             const tsir::support::Options &options,
                             std::ostream &out,
                             std::ostream &err,
                             tsir::support::SourceManager &sm);

/// @brief Execute the CLI: `tsir-verify [--jobs N] [--trace] <file.tsir>` or
///        `tsir-verify --version`.
/// @return Zero on success; one on usage, I/O, parse or verification failure.
int runCLI(int argc,
           char **argv,
           std::ostream &out,
           std::ostream &err,
           tsir::support::SourceManager &sm);

} // namespace tsir::tools::verify
