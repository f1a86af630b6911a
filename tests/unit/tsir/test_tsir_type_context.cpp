// File: tests/unit/tsir/test_tsir_type_context.cpp
// Purpose: Validate context-store ordering, trait lookup and well-formedness.
// Key invariants: Declarations may only refer to earlier ones; trait facts
//                 are matched structurally with '_ as the only wildcard.
// Ownership/Lifetime: Each test owns its TypeContext scopes.
// Links: docs/tsir-verifier.md

#include <gtest/gtest.h>

#include "tsir/core/TypeContext.hpp"

using namespace tsir::core;

namespace
{

UserTypeDecl makeType(std::string name,
                      uint64_t size,
                      std::vector<std::string> lifetimes = {},
                      std::vector<std::string> params = {})
{
    UserTypeDecl decl;
    decl.name = std::move(name);
    decl.size = size;
    decl.lifetimeParams = std::move(lifetimes);
    decl.typeParams = std::move(params);
    return decl;
}

UserTypeDecl makeVariant(std::string name, std::string parent, uint64_t size)
{
    UserTypeDecl decl = makeType(std::move(name), size);
    decl.parent = std::move(parent);
    return decl;
}

} // namespace

TEST(TypeContext, ValidStoreValidates)
{
    TypeContext types;
    types.addUserType(makeType("i32", 4));
    types.addUserType(makeType("Shape", 8));
    types.addUserType(makeVariant("Circle", "Shape", 8));
    types.addImpl(ImplFact{"Copy", Type::user("i32"), {}});
    types.addPrimOp(
        PrimOpDecl{"add", {Type::user("i32"), Type::user("i32")}, Type::user("i32"), {}});
    EXPECT_TRUE(types.validate());
    EXPECT_EQ(types.variantsOf("Shape").size(), 1u);
    EXPECT_EQ(types.sizeOf(Type::user("Circle")), 8u);
    EXPECT_FALSE(types.sizeOf(Type::absurd()).has_value());
}

TEST(TypeContext, ForwardReferenceIsRejected)
{
    TypeContext types;
    types.addUserType(makeVariant("Circle", "Shape", 8));
    types.addUserType(makeType("Shape", 8));
    auto result = types.validate();
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().message.find("undeclared type 'Shape'"), std::string::npos);

    TypeContext impls;
    impls.addImpl(ImplFact{"Copy", Type::user("i32"), {}});
    impls.addUserType(makeType("i32", 4));
    EXPECT_FALSE(impls.validate());
}

TEST(TypeContext, DuplicatesAndBadVariantsAreRejected)
{
    TypeContext dup;
    dup.addUserType(makeType("i32", 4));
    dup.addUserType(makeType("i32", 4));
    EXPECT_FALSE(dup.validate());

    TypeContext size;
    size.addUserType(makeType("Shape", 8));
    size.addUserType(makeVariant("Circle", "Shape", 4));
    EXPECT_FALSE(size.validate());

    TypeContext prim;
    prim.addUserType(makeType("i32", 4));
    prim.addPrimOp(PrimOpDecl{"none", {}, Type::user("i32"), {}});
    EXPECT_FALSE(prim.validate());
}

TEST(TypeContext, ImplFactsMatchWildcardLifetimes)
{
    TypeContext types;
    types.addUserType(makeType("i32", 4));
    types.addUserType(makeType("Ref", 8, {"r"}, {"T"}));
    types.addImpl(ImplFact{
        "Copy", Type::user("Ref", {Lifetime::wildcard()}, {Type::user("i32")}), {}});
    ASSERT_TRUE(types.validate());

    TypeContext scope(&types);
    scope.addLifetime(LifetimeDecl{Lifetime::named("a"), LifetimeDecl::Origin::Param});
    const Type refA = Type::user("Ref", {Lifetime::named("a")}, {Type::user("i32")});
    EXPECT_TRUE(scope.isCopy(refA));
    EXPECT_FALSE(scope.isCopy(Type::user("i32")));
    EXPECT_TRUE(scope.isCopy(Type::absurd()));
    EXPECT_TRUE(scope.checkWellFormed(refA));

    auto wildcard = scope.checkWellFormed(
        Type::user("Ref", {Lifetime::wildcard()}, {Type::user("i32")}));
    EXPECT_FALSE(wildcard);
}

TEST(TypeContext, PostulatesHoldInsideTheirScope)
{
    TypeContext types;
    TypeContext scope(&types);
    scope.addTypeParam(TypeParam{"T", 8});
    scope.addPostulate(TraitBound{Type::param("T"), "Copy"});
    ASSERT_TRUE(scope.validate());
    EXPECT_TRUE(scope.isCopy(Type::param("T")));
    EXPECT_FALSE(types.isCopy(Type::param("T")));
    EXPECT_EQ(scope.sizeOf(Type::param("T")), 8u);
}

TEST(TypeContext, WellFormedChecksArityAndLifetimes)
{
    TypeContext types;
    types.addUserType(makeType("i32", 4));
    types.addUserType(makeType("Ref", 8, {"r"}, {"T"}));

    EXPECT_FALSE(types.checkWellFormed(Type::user("Ref", {}, {Type::user("i32")})));
    EXPECT_FALSE(types.checkWellFormed(
        Type::user("Ref", {Lifetime::named("x")}, {Type::user("i32")})));
    EXPECT_TRUE(types.checkWellFormed(
        Type::user("Ref", {Lifetime::staticLifetime()}, {Type::user("i32")})));
    EXPECT_FALSE(types.checkWellFormed(Type::user("Missing")));
    EXPECT_FALSE(types.checkWellFormed(Type::param("T")));
}
