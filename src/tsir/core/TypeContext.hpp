//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/core/TypeContext.hpp
// Purpose: Declares the context store: user types, generic parameters,
//          lifetimes, trait facts and primitive operation signatures.
// Key invariants: Declarations are ordered; a name must be declared before a
//                 later declaration refers to it.  A child scope layers its
//                 declarations over a parent that it never mutates.
// Ownership/Lifetime: Program owns the root store; function scopes are
//                     stack-allocated children referencing it.
// Links: docs/tsir-format.md#declarations
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_location.hpp"
#include "tsir/core/Bound.hpp"
#include "tsir/core/Function.hpp"
#include "tsir/core/Lifetime.hpp"
#include "tsir/core/Type.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tsir::core
{

/// @brief Declaration of a user type or of a variant of an enum.
struct UserTypeDecl
{
    std::string name;
    std::vector<std::string> lifetimeParams;
    std::vector<std::string> typeParams;
    uint64_t size = 0;

    /// Enclosing enum when this declaration is a variant.
    std::optional<std::string> parent;

    support::SourceLoc loc{};
};

/// @brief Lifetime introduced by a signature or by a begin node.
struct LifetimeDecl
{
    enum class Origin
    {
        Param,
        Local
    };

    Lifetime lifetime;
    Origin origin = Origin::Param;
};

/// @brief Concrete fact `impl Trait for Type`; lifetimes may be `'_`.
struct ImplFact
{
    std::string trait;
    Type type;
    support::SourceLoc loc{};
};

/// @brief Signature of a primitive operation used by unary/binary rvalues.
struct PrimOpDecl
{
    std::string name;
    std::vector<Type> params;
    Type result;
    support::SourceLoc loc{};
};

/// @brief Any declaration in a context store; TraitBound is a where-clause
///        postulate.
using Decl = std::variant<UserTypeDecl, TypeParam, LifetimeDecl, ImplFact, TraitBound, PrimOpDecl>;

/// @brief Immutable-after-construction record of everything a type can refer to.
class TypeContext
{
  public:
    TypeContext() = default;

    /// @brief Create a scope layered over @p parent.
    explicit TypeContext(const TypeContext *parent);

    void addUserType(UserTypeDecl decl);
    void addTypeParam(TypeParam param);
    void addLifetime(LifetimeDecl decl);
    void addImpl(ImplFact fact);
    void addPostulate(TraitBound bound);
    void addPrimOp(PrimOpDecl decl);

    [[nodiscard]] const std::vector<Decl> &decls() const
    {
        return decls_;
    }

    [[nodiscard]] const TypeContext *parent() const
    {
        return parent_;
    }

    const UserTypeDecl *findUserType(std::string_view name) const;
    const TypeParam *findTypeParam(std::string_view name) const;
    const LifetimeDecl *findLifetime(const Lifetime &lt) const;
    const PrimOpDecl *findPrimOp(std::string_view name) const;

    /// @brief True for 'static and every declared lifetime in scope.
    [[nodiscard]] bool hasLifetime(const Lifetime &lt) const;

    /// @brief Direct variants of enum @p name across the scope chain.
    std::vector<const UserTypeDecl *> variantsOf(std::string_view name) const;

    /// @brief Decide `type: trait` by fact lookup only.
    /// @details Succeeds when an impl fact matches structurally (a `'_`
    ///          lifetime in the fact matches any lifetime) or an identical
    ///          where-clause postulate is in scope.  The absurd type holds
    ///          every trait.
    [[nodiscard]] bool holds(const Type &type, std::string_view trait) const;

    [[nodiscard]] bool isCopy(const Type &type) const
    {
        return holds(type, "Copy");
    }

    /// @brief Byte size of @p type; empty for `!` and unresolved names.
    std::optional<uint64_t> sizeOf(const Type &type) const;

    /// @brief Check that @p type resolves, has matching arity and only names
    ///        declared lifetimes.
    support::Expected<void> checkWellFormed(const Type &type) const;

    /// @brief Check ordering, duplicate names and variant shapes of this scope.
    support::Expected<void> validate() const;

    /// @brief Type required of branch conditions.
    Type conditionType() const;

  private:
    static constexpr size_t kAll = std::numeric_limits<size_t>::max();

    template <class T, class Pred> const T *find(Pred pred, size_t limit) const;
    const UserTypeDecl *findUserTypeBefore(std::string_view name, size_t limit) const;
    const TypeParam *findTypeParamBefore(std::string_view name, size_t limit) const;
    bool hasLifetimeBefore(const Lifetime &lt, size_t limit) const;
    support::Expected<void> checkType(const Type &type, size_t limit, bool allowWildcard) const;
    support::Expected<void> validateDecl(const Decl &decl, size_t index) const;

    const TypeContext *parent_ = nullptr;
    std::vector<Decl> decls_;
};

} // namespace tsir::core
