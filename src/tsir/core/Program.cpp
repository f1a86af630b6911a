//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/Program.cpp
// Purpose: Signature lookup across definitions and extern declarations.
// Links: docs/tsir-format.md
//
//===----------------------------------------------------------------------===//

#include "tsir/core/Program.hpp"

namespace tsir::core
{

std::optional<FunctionSig> Program::findSignature(std::string_view name) const
{
    for (const auto &fn : functions)
    {
        if (fn.name == name)
            return fn.signature();
    }
    for (const auto &sig : externs)
    {
        if (sig.name == name)
            return sig;
    }
    return std::nullopt;
}

} // namespace tsir::core
