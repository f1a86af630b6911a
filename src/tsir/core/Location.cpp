//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/Location.cpp
// Purpose: Construction, comparison and rendering of IR locations.
// Links: docs/tsir-format.md#locations
//
//===----------------------------------------------------------------------===//

#include "tsir/core/Location.hpp"

#include <tuple>
#include <utility>

namespace tsir::core
{
namespace
{
Location make(Location::Kind kind, std::string name)
{
    Location loc;
    loc.kind = kind;
    loc.name = std::move(name);
    return loc;
}
} // namespace

Location Location::returnSlot()
{
    return Location{};
}

Location Location::staticVar(std::string name)
{
    return make(Kind::Static, std::move(name));
}

Location Location::local(std::string name)
{
    return make(Kind::Local, std::move(name));
}

Location Location::param(std::string name)
{
    return make(Kind::Param, std::move(name));
}

std::string Location::toString() const
{
    switch (kind)
    {
        case Kind::Return:
            return "ret";
        case Kind::Static:
            return "@" + name;
        case Kind::Local:
            return "%" + name;
        case Kind::Param:
            return "$" + name;
    }
    return "?";
}

bool Location::operator==(const Location &other) const
{
    return kind == other.kind && name == other.name;
}

bool Location::operator!=(const Location &other) const
{
    return !(*this == other);
}

bool Location::operator<(const Location &other) const
{
    return std::tie(kind, name) < std::tie(other.kind, other.name);
}

} // namespace tsir::core
