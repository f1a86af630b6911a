//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/LifetimeTracker.hpp
// Purpose: Active-lifetime sets, outlives-obligation sets and the rules that
//          propagate them across ordinary, begin, end and call nodes.
// Key invariants: 'static outlives every lifetime; entailment closes facts
//                 under reflexivity and transitivity only.  Pinned lifetimes
//                 ('static and signature lifetimes) can never begin or end.
// Ownership/Lifetime: BoundContext and LifetimeState are values; the tracker
//                     holds only a copy of the pinned set.
// Links: docs/tsir-verifier.md#lifetimes
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tsir/core/Bound.hpp"
#include "tsir/core/Lifetime.hpp"
#include "tsir/core/NodeType.hpp"
#include "tsir/verify/LocationContext.hpp"
#include "tsir/verify/Violation.hpp"

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tsir::verify
{

/// @brief Set of outlives facts assumed at a program point.
class BoundContext
{
  public:
    BoundContext() = default;
    explicit BoundContext(std::vector<core::Outlives> facts);

    void add(core::Outlives fact);

    [[nodiscard]] const std::vector<core::Outlives> &facts() const
    {
        return facts_;
    }

    /// @brief Decide `longer: shorter` by reflexivity, transitivity and
    ///        'static outliving everything.
    [[nodiscard]] bool outlives(const core::Lifetime &longer, const core::Lifetime &shorter) const;

    /// @brief Decide `type: shorter`.
    /// @details Derivable from a literal fact, from `type: a` with `a: shorter`,
    ///          or structurally when every lifetime and type parameter inside
    ///          @p type outlives @p shorter.
    [[nodiscard]] bool typeOutlives(const core::Type &type, const core::Lifetime &shorter) const;

    [[nodiscard]] bool entails(const core::Outlives &fact) const;

    /// @brief First fact of @p other not entailed by this context, or nullptr.
    const core::Outlives *firstUnentailed(const BoundContext &other) const;

    /// @brief Copy without facts mentioning @p lt.
    BoundContext without(const core::Lifetime &lt) const;

    std::string toString() const;

  private:
    std::vector<core::Outlives> facts_;
};

/// @brief Lifetime and bound components of a node type.
struct LifetimeState
{
    std::set<core::Lifetime> active;
    BoundContext bounds;

    static LifetimeState fromNodeType(const core::NodeType &type);

    std::string activeToString() const;
};

class LifetimeTracker
{
  public:
    /// @param pinned 'static plus the signature's lifetime parameters.
    explicit LifetimeTracker(std::set<core::Lifetime> pinned) : pinned_(std::move(pinned)) {}

    /// @brief Ordinary node: active set unchanged, successor bounds entailed.
    /// @details Facts naming a lifetime begun in the body stay pending until
    ///          that lifetime ends, so the successor must entail them too.
    CheckResult propagate(const LifetimeState &cur, const LifetimeState &succ) const;

    /// @brief `begin lt`: successor active set is cur ∪ {lt}; successor may
    ///        assume `a: lt` for every lifetime active before the node.
    CheckResult begin(const core::Lifetime &lt,
                      const LifetimeState &cur,
                      const LifetimeState &succ) const;

    /// @brief Precondition of `end lt` that does not depend on the successor.
    /// @details Fails DanglingLifetime while a location still mentions
    ///          @p lt; checks pending facts against the derived ones.
    CheckResult endLocal(const core::Lifetime &lt,
                         const LifetimeState &cur,
                         const LocationContext &ctx) const;

    /// @brief `end lt` successor check: active set is cur \ {lt}; successor
    ///        bounds entailed by cur's remaining facts plus derived ones.
    CheckResult end(const core::Lifetime &lt,
                    const LifetimeState &cur,
                    const LifetimeState &succ) const;

    /// @brief Each instantiated where-clause outlives bound must be entailed
    ///        by the ambient bounds.
    CheckResult callObligations(const std::vector<core::Outlives> &bounds,
                                const LifetimeState &cur) const;

    [[nodiscard]] bool isPinned(const core::Lifetime &lt) const
    {
        return pinned_.count(lt) != 0;
    }

    const std::set<core::Lifetime> &pinned() const
    {
        return pinned_;
    }

  private:
    /// Facts `a: lt` for every `a` in @p active.
    static BoundContext derivedFacts(const core::Lifetime &lt,
                                     const std::set<core::Lifetime> &active,
                                     const BoundContext &base);

    CheckResult compareActive(const std::set<core::Lifetime> &want,
                              const std::set<core::Lifetime> &have) const;

    [[nodiscard]] bool mentionsLocal(const core::Outlives &fact) const;

    /// Every pending fact of @p cur not mentioning @p ending must be entailed
    /// by @p succ.
    CheckResult keepPending(const BoundContext &cur,
                            const BoundContext &succ,
                            const core::Lifetime *ending = nullptr) const;

    std::set<core::Lifetime> pinned_;
};

/// @brief Decide `sub <: super` on whole node types.
/// @details Locations relate by depth subtyping, the active lifetimes must be
///          equal, and the facts of @p sub must entail every fact of @p super.
///          A node type listing a location twice relates to nothing.
[[nodiscard]] bool isSubNodeType(const ContextEngine &engine,
                                 const core::NodeType &sub,
                                 const core::NodeType &super);

} // namespace tsir::verify
