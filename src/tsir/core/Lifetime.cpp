//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/Lifetime.cpp
// Purpose: Construction, comparison and rendering of lifetime names.
// Links: docs/tsir-format.md#lifetimes
//
//===----------------------------------------------------------------------===//

#include "tsir/core/Lifetime.hpp"

#include <tuple>
#include <utility>

namespace tsir::core
{

Lifetime Lifetime::staticLifetime()
{
    return Lifetime{};
}

Lifetime Lifetime::named(std::string name)
{
    Lifetime lt;
    lt.kind = Kind::Named;
    lt.name = std::move(name);
    return lt;
}

Lifetime Lifetime::wildcard()
{
    Lifetime lt;
    lt.kind = Kind::Wildcard;
    return lt;
}

std::string Lifetime::toString() const
{
    switch (kind)
    {
        case Kind::Static:
            return "'static";
        case Kind::Named:
            return "'" + name;
        case Kind::Wildcard:
            return "'_";
    }
    return "'?";
}

bool Lifetime::operator==(const Lifetime &other) const
{
    return kind == other.kind && name == other.name;
}

bool Lifetime::operator!=(const Lifetime &other) const
{
    return !(*this == other);
}

bool Lifetime::operator<(const Lifetime &other) const
{
    return std::tie(kind, name) < std::tie(other.kind, other.name);
}

} // namespace tsir::core
