//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/LocationContext.hpp
// Purpose: Per-node mapping from locations to types and the engine that
//          applies moves, copies, writes and drops to it.
// Key invariants: A context is total and single-valued over the locations it
//                 mentions.  Statics live in a separate fixed context and are
//                 never updated by the engine.
// Ownership/Lifetime: Contexts are ephemeral values; the engine borrows the
//                     store, the relations and the static context.
// Links: docs/tsir-verifier.md#contexts
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tsir/core/Lifetime.hpp"
#include "tsir/core/Location.hpp"
#include "tsir/core/Node.hpp"
#include "tsir/core/NodeType.hpp"
#include "tsir/core/Type.hpp"
#include "tsir/verify/TypeRelations.hpp"
#include "tsir/verify/Violation.hpp"

#include <map>
#include <string>
#include <vector>

namespace tsir::verify
{

class LocationContext
{
  public:
    using Map = std::map<core::Location, core::Type>;

    LocationContext() = default;

    /// @brief Build a context from declared bindings.
    /// @return MalformedContext when a location is listed twice.
    static VResult<LocationContext> fromBindings(
        const std::vector<core::LocationBinding> &bindings);

    /// @brief Type of @p loc or nullptr when not mentioned.
    const core::Type *find(const core::Location &loc) const;

    [[nodiscard]] bool contains(const core::Location &loc) const
    {
        return slots_.count(loc) != 0;
    }

    void set(const core::Location &loc, core::Type type);

    /// @brief True when some location holds `!`.
    [[nodiscard]] bool hasAbsurd() const;

    /// @brief Locations whose type mentions @p lt.
    std::vector<core::Location> locationsMentioning(const core::Lifetime &lt) const;

    [[nodiscard]] size_t size() const
    {
        return slots_.size();
    }

    Map::const_iterator begin() const
    {
        return slots_.begin();
    }

    Map::const_iterator end() const
    {
        return slots_.end();
    }

    /// @brief Render as `[$x: T, ret: uninit<8>]`.
    std::string toString() const;

    bool operator==(const LocationContext &other) const
    {
        return slots_ == other.slots_;
    }

  private:
    Map slots_;
};

/// @brief Result of reading a location: its type and the updated context.
struct Consumed
{
    core::Type type;
    LocationContext ctx;
};

class ContextEngine
{
  public:
    ContextEngine(const TypeRelations &relations, const LocationContext &statics)
        : relations_(relations), statics_(statics)
    {
    }

    /// @brief Read @p loc, moving it out unless its type is Copy.
    /// @details Non-Copy values leave `uninit<size>` behind.  Reading an
    ///          uninit location is UseAfterMove; moving out of a non-Copy
    ///          static is TypeMismatch.
    VResult<Consumed> consume(const core::Location &loc, const LocationContext &ctx) const;

    /// @brief Evaluate an operand: consume a location or check a constant.
    VResult<Consumed> operand(const core::Operand &op, const LocationContext &ctx) const;

    /// @brief Check that @p loc is uninit (before an rvalue is evaluated).
    CheckResult requireUninit(const core::Location &loc, const LocationContext &ctx) const;

    /// @brief Write a value of @p type into uninit location @p loc.
    VResult<LocationContext> assign(const core::Location &loc,
                                    const core::Type &type,
                                    const LocationContext &ctx) const;

    /// @brief Release a Copy value, leaving `uninit<size>` behind.
    VResult<LocationContext> drop(const core::Location &loc, const LocationContext &ctx) const;

    /// @brief Check @p actual against @p required pointwise by depth subtyping.
    /// @details Both contexts must mention the same locations; a missing or
    ///          extra location is MalformedContext, a non-subtype binding is
    ///          TypeMismatch.  A context holding `!` satisfies any requirement.
    CheckResult equalsRequired(const LocationContext &actual,
                               const LocationContext &required) const;

    /// @brief Depth subtyping between contexts over the same domain.
    [[nodiscard]] bool isSubcontext(const LocationContext &sub, const LocationContext &super) const;

    const LocationContext &statics() const
    {
        return statics_;
    }

  private:
    const TypeRelations &relations_;
    const LocationContext &statics_;
};

} // namespace tsir::verify
