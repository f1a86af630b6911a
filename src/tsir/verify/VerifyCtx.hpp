//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/VerifyCtx.hpp
// Purpose: Bundle of borrowed state shared by the per-node checking rules of
//          one function.
// Key invariants: Every member outlives the node checks using it; nothing in
//                 the bundle is mutated while nodes are checked.
// Ownership/Lifetime: Non-owning references only.
// Links: docs/tsir-verifier.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tsir/core/fwd.hpp"
#include "tsir/verify/LifetimeTracker.hpp"
#include "tsir/verify/LocationContext.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tsir::verify
{

class DiagSink;

struct LabelMapHash
{
    using is_transparent = void;

    std::size_t operator()(std::string_view sv) const noexcept
    {
        return std::hash<std::string_view>{}(sv);
    }

    std::size_t operator()(const std::string &s) const noexcept
    {
        return std::hash<std::string_view>{}(std::string_view{s});
    }
};

struct LabelMapEqual
{
    using is_transparent = void;

    bool operator()(std::string_view lhs, std::string_view rhs) const noexcept
    {
        return lhs == rhs;
    }
};

/// Label name to index in Function::nodes.
using LabelMap = std::unordered_map<std::string_view, size_t, LabelMapHash, LabelMapEqual>;

/// Callee name to signature, covering definitions and extern declarations.
using SignatureMap = std::unordered_map<std::string, core::FunctionSig>;

/// @brief Declared node type of one label, split into checkable parts.
struct NodeState
{
    LocationContext ctx;
    LifetimeState lifetimes;
};

struct VerifyCtx
{
    const core::Function &fn;             ///< Function being verified.
    const core::TypeContext &types;       ///< Function-scoped context store.
    const TypeRelations &relations;       ///< Subtyping over @ref types.
    const ContextEngine &engine;          ///< Move/copy/write/drop rules.
    const LifetimeTracker &lifetimes;     ///< Lifetime transition rules.
    const SignatureMap &signatures;       ///< Known callee signatures.
    const LabelMap &labels;               ///< Label table index.
    const std::vector<NodeState> &states; ///< Declared state per label index.
    const NodeState &exitState;           ///< State synthesized for `exit`.
};

} // namespace tsir::verify
