//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/io/Serializer.hpp
// Purpose: Render a Program back to .tsir text.
// Key invariants: Output is accepted by Parser and reproduces the same
//                 declarations, signatures and node graphs.
// Ownership/Lifetime: Reads the Program; writes only to the given stream.
// Links: docs/tsir-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tsir/core/fwd.hpp"

#include <ostream>
#include <string>

namespace tsir::io
{

class Serializer
{
  public:
    static void write(const core::Program &program, std::ostream &os);

    static std::string toString(const core::Program &program);
};

} // namespace tsir::io
