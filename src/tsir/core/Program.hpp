//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/Program.hpp
// Purpose: Top-level container for a context store, statics, extern
//          signatures and function definitions.
// Key invariants: Read-only once a loader has finished building it.
// Ownership/Lifetime: Owns all contained declarations by value.
// Links: docs/tsir-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tsir/core/Function.hpp"
#include "tsir/core/Location.hpp"
#include "tsir/core/Type.hpp"
#include "tsir/core/TypeContext.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tsir::core
{

/// @brief Program-wide static slot with its fixed type.
struct StaticDecl
{
    Location loc;
    Type type;
    support::SourceLoc srcLoc{};
};

struct Program
{
    /// Format version from the `tsir` banner.
    std::string version;

    TypeContext types;
    std::vector<StaticDecl> statics;
    std::vector<FunctionSig> externs;
    std::vector<Function> functions;

    /// @brief Signature of the defined or extern function named @p name.
    std::optional<FunctionSig> findSignature(std::string_view name) const;
};

} // namespace tsir::core
