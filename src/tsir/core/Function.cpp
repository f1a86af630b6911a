//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/Function.cpp
// Purpose: Derived views over a function definition.
// Links: docs/tsir-format.md#functions
//
//===----------------------------------------------------------------------===//

#include "tsir/core/Function.hpp"

namespace tsir::core
{

FunctionSig Function::signature() const
{
    FunctionSig sig;
    sig.name = name;
    sig.generics = generics;
    sig.params.reserve(params.size());
    for (const auto &p : params)
        sig.params.push_back(p.type);
    sig.ret = retType;
    sig.loc = loc;
    return sig;
}

std::vector<Location> Function::slots() const
{
    std::vector<Location> out;
    out.reserve(params.size() + locals.size() + 1);
    for (const auto &p : params)
        out.push_back(p.loc);
    out.insert(out.end(), locals.begin(), locals.end());
    out.push_back(Location::returnSlot());
    return out;
}

} // namespace tsir::core
