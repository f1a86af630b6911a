//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the standalone `tsir-verify` CLI. The executable reads a .tsir
// program, runs the typestate verifier over every function and reports the
// result on stdout/stderr.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"
#include "tools/tsir-verify/driver.hpp"

#include <iostream>

#ifndef TSIR_VERIFY_SKIP_MAIN
int main(int argc, char **argv)
{
    tsir::support::SourceManager sm;
    return tsir::tools::verify::runCLI(argc, argv, std::cout, std::cerr, sm);
}
#endif
