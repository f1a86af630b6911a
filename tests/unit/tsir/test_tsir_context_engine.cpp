// File: tests/unit/tsir/test_tsir_context_engine.cpp
// Purpose: Check move, copy, drop and initialisation rules of the context engine.
// Key invariants: Non-Copy reads leave uninit<size>; Copy reads do not; writes
//                 require an uninit destination.
// Ownership/Lifetime: Fixture owns the Program and the statics context.
// Links: docs/tsir-verifier.md

#include <gtest/gtest.h>

#include "tsir/build/ProgramBuilder.hpp"
#include "tsir/verify/LocationContext.hpp"
#include "tsir/verify/TypeRelations.hpp"

using namespace tsir::core;
using tsir::build::ProgramBuilder;
using tsir::verify::ContextEngine;
using tsir::verify::LocationContext;
using tsir::verify::TypeRelations;
using tsir::verify::VerifyDiagCode;

namespace
{

class ContextEngineTest : public ::testing::Test
{
  protected:
    ContextEngineTest() : relations(program.types), engine(relations, statics)
    {
        ProgramBuilder pb(program);
        pb.type("i32", 4).type("Box", 8).impl("Copy", Type::user("i32"));
        statics.set(Location::staticVar("LIMIT"), Type::user("i32"));
        statics.set(Location::staticVar("HEAP"), Type::user("Box"));
    }

    Program program;
    LocationContext statics;
    TypeRelations relations;
    ContextEngine engine;

    const Location x = Location::local("x");
    const Location y = Location::local("y");
};

} // namespace

TEST_F(ContextEngineTest, NonCopyValueMovesOnce)
{
    LocationContext ctx;
    ctx.set(x, Type::uninit(8));

    auto assigned = engine.assign(x, Type::user("Box"), ctx);
    ASSERT_TRUE(assigned);
    EXPECT_EQ(*assigned.value().find(x), Type::user("Box"));

    auto first = engine.consume(x, assigned.value());
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value().type, Type::user("Box"));
    EXPECT_EQ(*first.value().ctx.find(x), Type::uninit(8));

    auto second = engine.consume(x, first.value().ctx);
    ASSERT_FALSE(second);
    EXPECT_EQ(second.error().code, VerifyDiagCode::UseAfterMove);
    ASSERT_EQ(second.error().locations.size(), 1u);
    EXPECT_EQ(second.error().locations.front(), x);
}

TEST_F(ContextEngineTest, CopyValueCanBeReadRepeatedly)
{
    LocationContext ctx;
    ctx.set(x, Type::user("i32"));

    auto first = engine.consume(x, ctx);
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value().ctx, ctx);
    auto second = engine.consume(x, first.value().ctx);
    ASSERT_TRUE(second);
    EXPECT_EQ(*second.value().ctx.find(x), Type::user("i32"));
}

TEST_F(ContextEngineTest, DropReleasesCopyValueOnlyOnce)
{
    LocationContext ctx;
    ctx.set(x, Type::user("i32"));

    auto dropped = engine.drop(x, ctx);
    ASSERT_TRUE(dropped);
    EXPECT_EQ(*dropped.value().find(x), Type::uninit(4));

    auto again = engine.drop(x, dropped.value());
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, VerifyDiagCode::UseAfterMove);
}

TEST_F(ContextEngineTest, DropRejectsNonCopyValue)
{
    LocationContext ctx;
    ctx.set(x, Type::user("Box"));
    auto dropped = engine.drop(x, ctx);
    ASSERT_FALSE(dropped);
    EXPECT_EQ(dropped.error().code, VerifyDiagCode::TypeMismatch);
}

TEST_F(ContextEngineTest, AssignIntoInitializedSlotIsDoubleInit)
{
    LocationContext ctx;
    ctx.set(x, Type::user("i32"));
    auto assigned = engine.assign(x, Type::user("i32"), ctx);
    ASSERT_FALSE(assigned);
    EXPECT_EQ(assigned.error().code, VerifyDiagCode::DoubleInit);
}

TEST_F(ContextEngineTest, AssignChecksSlotSize)
{
    LocationContext ctx;
    ctx.set(x, Type::uninit(4));
    auto wrong = engine.assign(x, Type::user("Box"), ctx);
    ASSERT_FALSE(wrong);
    EXPECT_EQ(wrong.error().code, VerifyDiagCode::MalformedContext);

    auto absurd = engine.assign(x, Type::absurd(), ctx);
    ASSERT_TRUE(absurd);
    EXPECT_TRUE(absurd.value().hasAbsurd());
}

TEST_F(ContextEngineTest, StaticsAreReadOnly)
{
    LocationContext ctx;
    auto copy = engine.consume(Location::staticVar("LIMIT"), ctx);
    ASSERT_TRUE(copy);
    EXPECT_EQ(copy.value().type, Type::user("i32"));

    auto move = engine.consume(Location::staticVar("HEAP"), ctx);
    ASSERT_FALSE(move);
    EXPECT_EQ(move.error().code, VerifyDiagCode::TypeMismatch);

    auto write = engine.requireUninit(Location::staticVar("LIMIT"), ctx);
    ASSERT_FALSE(write);
    EXPECT_EQ(write.error().code, VerifyDiagCode::TypeMismatch);
}

TEST_F(ContextEngineTest, ConstantOperandsMustBeInitialized)
{
    LocationContext ctx;
    auto ok = engine.operand(Operand::constant(Type::user("i32")), ctx);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value().type, Type::user("i32"));

    auto uninit = engine.operand(Operand::constant(Type::uninit(4)), ctx);
    ASSERT_FALSE(uninit);
    EXPECT_EQ(uninit.error().code, VerifyDiagCode::TypeMismatch);

    auto unknown = engine.operand(Operand::constant(Type::user("Missing")), ctx);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, VerifyDiagCode::MalformedContext);
}

TEST_F(ContextEngineTest, RequiredContextComparison)
{
    LocationContext required;
    required.set(x, Type::user("i32"));
    required.set(y, Type::uninit(8));

    LocationContext actual = required;
    EXPECT_TRUE(engine.equalsRequired(actual, required));

    actual.set(y, Type::user("Box"));
    auto mismatch = engine.equalsRequired(actual, required);
    ASSERT_FALSE(mismatch);
    EXPECT_EQ(mismatch.error().code, VerifyDiagCode::TypeMismatch);
    EXPECT_EQ(mismatch.error().expected, required.toString());
    EXPECT_EQ(mismatch.error().actual, actual.toString());

    LocationContext extra = required;
    extra.set(Location::returnSlot(), Type::uninit(4));
    auto malformed = engine.equalsRequired(extra, required);
    ASSERT_FALSE(malformed);
    EXPECT_EQ(malformed.error().code, VerifyDiagCode::MalformedContext);

    LocationContext dead = required;
    dead.set(y, Type::absurd());
    dead.set(Location::returnSlot(), Type::user("Box"));
    EXPECT_TRUE(engine.equalsRequired(dead, required));
}

TEST_F(ContextEngineTest, DuplicateBindingIsMalformed)
{
    auto ctx = LocationContext::fromBindings(
        {LocationBinding{x, Type::user("i32")}, LocationBinding{x, Type::uninit(4)}});
    ASSERT_FALSE(ctx);
    EXPECT_EQ(ctx.error().code, VerifyDiagCode::MalformedContext);
}
