//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/NodeType.cpp
// Purpose: Textual rendering of node types for diagnostics and printing.
// Links: docs/tsir-format.md#node-types
//
//===----------------------------------------------------------------------===//

#include "tsir/core/NodeType.hpp"

#include <sstream>

namespace tsir::core
{

std::string NodeType::toString() const
{
    std::ostringstream os;
    os << '[';
    for (size_t i = 0; i < locations.size(); ++i)
    {
        if (i)
            os << ", ";
        os << locations[i].loc.toString() << ": " << locations[i].type.toString();
    }
    os << "; ";
    for (size_t i = 0; i < lifetimes.size(); ++i)
    {
        if (i)
            os << ", ";
        os << lifetimes[i].toString();
    }
    os << "; ";
    for (size_t i = 0; i < bounds.size(); ++i)
    {
        if (i)
            os << ", ";
        os << bounds[i].toString();
    }
    os << ']';
    return os.str();
}

} // namespace tsir::core
