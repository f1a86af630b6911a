// File: tests/unit/tsir/test_tsir_function_verifier.cpp
// Purpose: Verify whole functions built in memory, one node rule at a time.
// Key invariants: Accepted functions yield a judgment; rejected ones report the
//                 failing label, rule and diagnostic code.
// Ownership/Lifetime: Fixture owns the Program; builders reference it.
// Links: docs/tsir-verifier.md

#include <gtest/gtest.h>

#include "tsir/build/ProgramBuilder.hpp"
#include "tsir/verify/Verifier.hpp"

#include <optional>

using namespace tsir::core;
using tsir::build::FunctionBuilder;
using tsir::build::ProgramBuilder;
using tsir::verify::FunctionResult;
using tsir::verify::Verifier;
using tsir::verify::VerifyDiagCode;
using tsir::verify::VerifyReport;
using tsir::verify::Violation;

namespace
{

const Type kBool = Type::user("bool");
const Type kI32 = Type::user("i32");
const Type kBox = Type::user("Box");
const Type kUnit = Type::user("unit");
const Type kShape = Type::user("Shape");
const Type kCircle = Type::user("Circle");
const Type kSquare = Type::user("Square");
const Type kTri = Type::user("Tri");

const Location kRet = Location::returnSlot();

class FunctionVerifierTest : public ::testing::Test
{
  protected:
    FunctionVerifierTest() : pb(program)
    {
        pb.type("bool", 1)
            .type("i32", 4)
            .type("unit", 0)
            .type("Box", 8)
            .type("Handle", 4)
            .type("Shape", 8)
            .variant("Circle", "Shape")
            .variant("Square", "Shape")
            .variant("Tri", "Shape")
            .type("Ref", 8, {"r"}, {"T"})
            .impl("Copy", kBool)
            .impl("Copy", kI32)
            .impl("Copy", Type::user("Ref", {Lifetime::wildcard()}, {kI32}))
            .primop("add", {kI32, kI32}, kI32);
    }

    const FunctionResult &verify(const std::string &name)
    {
        report = Verifier::run(program);
        EXPECT_FALSE(report.programError.has_value());
        for (const auto &result : report.functions)
        {
            if (result.function == name)
                return result;
        }
        ADD_FAILURE() << "no result for @" << name;
        return missing;
    }

    /// Expect @p name to fail with @p code at @p label.
    void expectViolation(const std::string &name,
                         VerifyDiagCode code,
                         const std::string &label,
                         const std::string &rule = {})
    {
        const FunctionResult &result = verify(name);
        ASSERT_FALSE(result.ok());
        ASSERT_TRUE(result.violation.has_value());
        const Violation &v = *result.violation;
        EXPECT_EQ(v.code, code) << v.toDiag().message;
        EXPECT_EQ(v.function, name);
        EXPECT_EQ(v.label, label) << v.toDiag().message;
        if (!rule.empty())
            EXPECT_EQ(v.rule, rule);
    }

    Program program;
    ProgramBuilder pb;
    VerifyReport report;
    FunctionResult missing;
};

} // namespace

TEST_F(FunctionVerifierTest, MoveIntoReturnSlot)
{
    auto fb = pb.function("pass", kBox);
    auto b = fb.param("b", kBox);
    fb.assign("entry", fb.state({{b, kBox}}), kRet, Operand::use(b), "exit");

    const auto &result = verify("pass");
    ASSERT_TRUE(result.ok()) << result.violation->toDiag().message;
    EXPECT_EQ(result.judgment->toString(), "fn @pass(Box) -> Box");
}

TEST_F(FunctionVerifierTest, SecondMoveIsUseAfterMove)
{
    auto fb = pb.function("twice", kBox);
    auto b = fb.param("b", kBox);
    auto t = fb.local("t", 8);
    fb.assign("entry", fb.state({{b, kBox}}), t, Operand::use(b), "l1")
        .assign("l1", fb.state({{t, kBox}}), kRet, Operand::use(b), "exit");

    expectViolation("twice", VerifyDiagCode::UseAfterMove, "l1", "assign");
    const Violation &v = *report.functions.front().violation;
    ASSERT_EQ(v.locations.size(), 1u);
    EXPECT_EQ(v.locations.front(), b);
    EXPECT_EQ(v.snippet, "assign ret = $b -> exit");
}

TEST_F(FunctionVerifierTest, CopyValuesAreReusedThenDropped)
{
    auto fb = pb.function("dup", kI32);
    auto x = fb.param("x", kI32);
    auto t = fb.local("t", 4);
    fb.assign("entry", fb.state({{x, kI32}}), t, Operand::use(x), "l1")
        .assignOp("l1",
                  fb.state({{x, kI32}, {t, kI32}}),
                  kRet,
                  "add",
                  {Operand::use(x), Operand::use(t)},
                  "l2")
        .drop("l2", fb.state({{x, kI32}, {t, kI32}, {kRet, kI32}}), x, "l3")
        .drop("l3", fb.state({{t, kI32}, {kRet, kI32}}), t, "exit");

    const auto &result = verify("dup");
    EXPECT_TRUE(result.ok()) << result.violation->toDiag().message;
}

TEST_F(FunctionVerifierTest, AssignIntoLiveParameterIsDoubleInit)
{
    auto fb = pb.function("init", kI32);
    auto x = fb.param("x", kI32);
    fb.assign("entry", fb.state({{x, kI32}}), x, Operand::constant(kI32), "exit");
    expectViolation("init", VerifyDiagCode::DoubleInit, "entry", "assign");
}

TEST_F(FunctionVerifierTest, PrimOpOperandTypesAreChecked)
{
    auto fb = pb.function("sum", kI32);
    auto c = fb.param("c", kBool);
    fb.assignOp("entry",
                fb.state({{c, kBool}}),
                kRet,
                "add",
                {Operand::use(c), Operand::constant(kI32)},
                "exit");
    expectViolation("sum", VerifyDiagCode::TypeMismatch, "entry", "assign");

    auto unknown = pb.function("mul", kI32);
    unknown.assignOp("entry",
                     unknown.state(),
                     kRet,
                     "mul",
                     {Operand::constant(kI32), Operand::constant(kI32)},
                     "exit");
    expectViolation("mul", VerifyDiagCode::MalformedContext, "entry");
}

TEST_F(FunctionVerifierTest, LiveValueAtExitIsRejected)
{
    auto fb = pb.function("leak", kUnit);
    auto b = fb.param("b", kBox);
    fb.assign("entry", fb.state({{b, kBox}}), kRet, Operand::constant(kUnit), "exit");
    expectViolation("leak", VerifyDiagCode::TypeMismatch, "entry");
    EXPECT_NE(report.functions.front().violation->message.find("successor 'exit'"),
              std::string::npos);
}

TEST_F(FunctionVerifierTest, AbsurdConstantIsRejected)
{
    // Writing `!` would make the rest of the function vacuously well typed.
    auto fb = pb.function("leak", kUnit);
    auto b = fb.param("b", kBox);
    auto t = fb.local("t", 8);
    fb.assign("entry", fb.state({{b, kBox}}), t, Operand::constant(Type::absurd()), "exit");

    expectViolation("leak", VerifyDiagCode::TypeMismatch, "entry", "assign");
    EXPECT_NE(report.functions.front().violation->message.find("absurd"), std::string::npos);
}

TEST_F(FunctionVerifierTest, ExhaustiveSwitchNarrowsScrutinee)
{
    auto fb = pb.function("classify", kShape);
    auto s = fb.param("s", kShape);
    fb.node("entry",
            fb.state({{s, kShape}}),
            SwitchNode{s, kShape, {{kCircle, "c"}, {kSquare, "q"}, {kTri, "t"}}})
        .assign("c", fb.state({{s, kCircle}}), kRet, Operand::use(s), "exit")
        .assign("q", fb.state({{s, kShape}}), kRet, Operand::use(s), "exit")
        .assign("t", fb.state({{s, kShape}}), kRet, Operand::use(s), "exit");

    const auto &result = verify("classify");
    EXPECT_TRUE(result.ok()) << result.violation->toDiag().message;
}

TEST_F(FunctionVerifierTest, MissingArmIsNonExhaustive)
{
    auto fb = pb.function("classify", kShape);
    auto s = fb.param("s", kShape);
    fb.node("entry",
            fb.state({{s, kShape}}),
            SwitchNode{s, kShape, {{kCircle, "c"}, {kSquare, "q"}}})
        .assign("c", fb.state({{s, kCircle}}), kRet, Operand::use(s), "exit")
        .assign("q", fb.state({{s, kShape}}), kRet, Operand::use(s), "exit");

    expectViolation("classify", VerifyDiagCode::NonExhaustiveSwitch, "entry", "switch");
}

TEST_F(FunctionVerifierTest, ArmTargetMustAcceptNarrowedType)
{
    auto fb = pb.function("classify", kShape);
    auto s = fb.param("s", kShape);
    fb.node("entry",
            fb.state({{s, kShape}}),
            SwitchNode{s, kShape, {{kCircle, "c"}, {kShape, "q"}}})
        .assign("c", fb.state({{s, kSquare}}), kRet, Operand::use(s), "exit")
        .assign("q", fb.state({{s, kShape}}), kRet, Operand::use(s), "exit");

    expectViolation("classify", VerifyDiagCode::TypeMismatch, "entry", "switch");
}

TEST_F(FunctionVerifierTest, ImpossibleArmReachesUnreachable)
{
    auto fb = pb.function("dead", kShape);
    auto s = fb.param("s", kCircle);
    fb.node("entry",
            fb.state({{s, kCircle}}),
            SwitchNode{s, kShape, {{kCircle, "c"}, {kSquare, "d"}, {kTri, "d"}}})
        .assign("c", fb.state({{s, kCircle}}), kRet, Operand::use(s), "exit")
        .unreachable("d", fb.state({{s, Type::absurd()}}));

    const auto &result = verify("dead");
    EXPECT_TRUE(result.ok()) << result.violation->toDiag().message;
}

TEST_F(FunctionVerifierTest, ReachableUnreachableIsRejected)
{
    auto fb = pb.function("oops", kUnit);
    fb.unreachable("entry", fb.state());
    expectViolation("oops", VerifyDiagCode::TypeMismatch, "entry", "unreachable");
}

TEST_F(FunctionVerifierTest, BranchChecksBothSuccessors)
{
    auto fb = pb.function("pick", kI32);
    auto c = fb.param("c", kBool);
    auto x = fb.param("x", kI32);
    fb.node("entry", fb.state({{c, kBool}, {x, kI32}}), IfNode{Operand::use(c), "a", "b"})
        .drop("a", fb.state({{c, kBool}, {x, kI32}}), c, "j")
        .drop("b", fb.state({{c, kBool}, {x, kI32}}), c, "j")
        .assign("j", fb.state({{x, kI32}}), kRet, Operand::use(x), "k")
        .drop("k", fb.state({{x, kI32}, {kRet, kI32}}), x, "exit");

    const auto &result = verify("pick");
    EXPECT_TRUE(result.ok()) << result.violation->toDiag().message;
}

TEST_F(FunctionVerifierTest, BranchConditionMustBeBool)
{
    auto fb = pb.function("pick", kUnit);
    auto x = fb.param("x", kI32);
    fb.node("entry", fb.state({{x, kI32}}), IfNode{Operand::use(x), "a", "a"})
        .drop("a", fb.state({{x, kI32}}), x, "b")
        .assign("b", fb.state(), kRet, Operand::constant(kUnit), "exit");
    expectViolation("pick", VerifyDiagCode::TypeMismatch, "entry", "if");
}

TEST_F(FunctionVerifierTest, LocalLifetimeEndsAfterLastUse)
{
    const Lifetime l = Lifetime::named("l");
    const Type refL = Type::user("Ref", {l}, {kI32});
    auto fb = pb.function("scope", kUnit);
    auto r = fb.local("r", 8);
    fb.begin("entry", fb.state(), l, "b")
        .assign("b", fb.state({}, {l}), r, Operand::constant(refL), "d")
        .drop("d", fb.state({{r, refL}}, {l}), r, "e")
        .end("e", fb.state({}, {l}), l, "f")
        .assign("f", fb.state(), kRet, Operand::constant(kUnit), "exit");

    const auto &result = verify("scope");
    EXPECT_TRUE(result.ok()) << result.violation->toDiag().message;
}

TEST_F(FunctionVerifierTest, EndingReferencedLifetimeDangles)
{
    const Lifetime l = Lifetime::named("l");
    const Type refL = Type::user("Ref", {l}, {kI32});
    auto fb = pb.function("scope", kUnit);
    auto r = fb.local("r", 8);
    fb.begin("entry", fb.state(), l, "b")
        .assign("b", fb.state({}, {l}), r, Operand::constant(refL), "e")
        .end("e", fb.state({{r, refL}}, {l}), l, "f")
        .drop("f", fb.state({{r, refL}}), r, "g")
        .assign("g", fb.state(), kRet, Operand::constant(kUnit), "exit");

    const auto &result = verify("scope");
    ASSERT_FALSE(result.ok());
    // The node type of `f` already mentions an inactive lifetime.
    EXPECT_EQ(result.violation->code, VerifyDiagCode::DanglingLifetime);
}

TEST_F(FunctionVerifierTest, EndWhileReferencedReportsLocation)
{
    const Lifetime l = Lifetime::named("l");
    const Type refL = Type::user("Ref", {l}, {kI32});
    auto fb = pb.function("scope", kUnit);
    auto r = fb.local("r", 8);
    fb.begin("entry", fb.state(), l, "b")
        .assign("b", fb.state({}, {l}), r, Operand::constant(refL), "e")
        .end("e", fb.state({{r, refL}}, {l}), l, "f")
        .assign("f", fb.state(), kRet, Operand::constant(kUnit), "exit");

    expectViolation("scope", VerifyDiagCode::DanglingLifetime, "e", "end");
    const Violation &v = *report.functions.front().violation;
    ASSERT_EQ(v.locations.size(), 1u);
    EXPECT_EQ(v.locations.front(), r);
}

TEST_F(FunctionVerifierTest, OutlivesFactCannotBeForgotten)
{
    const Lifetime a = Lifetime::named("a");
    const Lifetime b = Lifetime::named("b");
    const Outlives aOutlivesB = Outlives::lifetimes(a, b);

    // 'b is begun inside 'a, so 'a must not end first.
    auto forget = pb.function("forget", kUnit);
    forget.begin("entry", forget.state(), a, "la")
        .begin("la", forget.state({}, {a}), b, "lb")
        .assign("lb",
                forget.state({}, {a, b}, {aOutlivesB}),
                kRet,
                Operand::constant(kUnit),
                "lc")
        .end("lc", forget.state({{kRet, kUnit}}, {a, b}), a, "ld")
        .end("ld", forget.state({{kRet, kUnit}}, {b}), b, "exit");
    expectViolation("forget", VerifyDiagCode::ObligationUnproved, "lb", "assign");

    auto kept = pb.function("kept", kUnit);
    kept.begin("entry", kept.state(), a, "la")
        .begin("la", kept.state({}, {a}), b, "lb")
        .assign("lb",
                kept.state({}, {a, b}, {aOutlivesB}),
                kRet,
                Operand::constant(kUnit),
                "lc")
        .end("lc", kept.state({{kRet, kUnit}}, {a, b}, {aOutlivesB}), a, "ld")
        .end("ld", kept.state({{kRet, kUnit}}, {b}), b, "exit");
    expectViolation("kept", VerifyDiagCode::ObligationUnproved, "lc", "end");

    auto nested = pb.function("nested", kUnit);
    nested.begin("entry", nested.state(), a, "la")
        .begin("la", nested.state({}, {a}), b, "lb")
        .assign("lb",
                nested.state({}, {a, b}, {aOutlivesB}),
                kRet,
                Operand::constant(kUnit),
                "lc")
        .end("lc", nested.state({{kRet, kUnit}}, {a, b}, {aOutlivesB}), b, "ld")
        .end("ld", nested.state({{kRet, kUnit}}, {a}), a, "exit");
    const auto &result = verify("nested");
    EXPECT_TRUE(result.ok()) << result.violation->toDiag().message;
}

TEST_F(FunctionVerifierTest, LoopChecksBackEdgeOnce)
{
    const Lifetime l = Lifetime::named("l");
    const Type refL = Type::user("Ref", {l}, {kI32});
    auto fb = pb.function("spin", kUnit);
    auto c = fb.param("c", kBool);
    auto n = fb.local("n", 4);
    auto r = fb.local("r", 8);
    const NodeType head = fb.state({{c, kBool}, {n, kI32}});

    fb.assign("entry", fb.state({{c, kBool}}), n, Operand::constant(kI32), "head")
        .node("head", head, IfNode{Operand::use(c), "open", "done"})
        .begin("open", head, l, "use")
        .assign("use", fb.state({{c, kBool}, {n, kI32}}, {l}), r, Operand::constant(refL), "rel")
        .drop("rel", fb.state({{c, kBool}, {n, kI32}, {r, refL}}, {l}), r, "close")
        .end("close", fb.state({{c, kBool}, {n, kI32}}, {l}), l, "head")
        .drop("done", head, c, "fin")
        .drop("fin", fb.state({{n, kI32}}), n, "last")
        .assign("last", fb.state(), kRet, Operand::constant(kUnit), "exit");

    const auto &result = verify("spin");
    EXPECT_TRUE(result.ok()) << result.violation->toDiag().message;
}

TEST_F(FunctionVerifierTest, LoopBodyMustRestoreHeaderContext)
{
    const Lifetime l = Lifetime::named("l");
    auto fb = pb.function("spin", kUnit);
    auto c = fb.param("c", kBool);
    auto n = fb.local("n", 4);
    const NodeType head = fb.state({{c, kBool}, {n, kI32}});

    fb.assign("entry", fb.state({{c, kBool}}), n, Operand::constant(kI32), "head")
        .node("head", head, IfNode{Operand::use(c), "open", "done"})
        .begin("open", head, l, "use")
        .drop("use", fb.state({{c, kBool}, {n, kI32}}, {l}), c, "close")
        .end("close", fb.state({{n, kI32}}, {l}), l, "head")
        .drop("done", head, c, "fin")
        .drop("fin", fb.state({{n, kI32}}), n, "last")
        .assign("last", fb.state(), kRet, Operand::constant(kUnit), "exit");

    expectViolation("spin", VerifyDiagCode::TypeMismatch, "close", "end");
    EXPECT_NE(report.functions.front().violation->message.find("successor 'head'"),
              std::string::npos);
}

TEST_F(FunctionVerifierTest, GenericCallNeedsWhereClauseFacts)
{
    FunctionSig keep;
    keep.name = "keep";
    keep.generics.lifetimes = {Lifetime::named("a")};
    keep.generics.types = {TypeParam{"T", 8}};
    keep.generics.outlives = {Outlives::typeOutlives(Type::param("T"), Lifetime::named("a"))};
    keep.params = {Type::param("T")};
    keep.ret = kUnit;
    pb.addExtern(keep);

    const Lifetime b = Lifetime::named("b");
    const Type u = Type::param("U");

    auto good = pb.function("f", kUnit);
    good.lifetime("b").typeParam("U", 8).where(Outlives::typeOutlives(u, b));
    auto x = good.param("x", u);
    good.call("entry", good.state({{x, u}}), kRet, "keep", {b}, {u}, {Operand::use(x)}, "exit");

    auto bad = pb.function("g", kUnit);
    bad.lifetime("b").typeParam("U", 8);
    auto y = bad.param("x", u);
    bad.call("entry", bad.state({{y, u}}), kRet, "keep", {b}, {u}, {Operand::use(y)}, "exit");

    const auto &ok = verify("f");
    ASSERT_TRUE(ok.ok()) << ok.violation->toDiag().message;
    EXPECT_EQ(ok.judgment->toString(), "forall<'b, U> where U: 'b . fn @f(U) -> unit");

    expectViolation("g", VerifyDiagCode::ObligationUnproved, "entry", "call");
}

TEST_F(FunctionVerifierTest, TraitBoundsAreResolvedByFacts)
{
    FunctionSig copyIt;
    copyIt.name = "copy_it";
    copyIt.generics.types = {TypeParam{"T", 4}};
    copyIt.generics.traitBounds = {TraitBound{Type::param("T"), "Copy"}};
    copyIt.params = {Type::param("T")};
    copyIt.ret = Type::param("T");
    pb.addExtern(copyIt);

    auto good = pb.function("ints", kI32);
    good.call(
        "entry", good.state(), kRet, "copy_it", {}, {kI32}, {Operand::constant(kI32)}, "exit");

    const Type handle = Type::user("Handle");
    auto bad = pb.function("handles", handle);
    bad.call(
        "entry", bad.state(), kRet, "copy_it", {}, {handle}, {Operand::constant(handle)}, "exit");

    const auto &ok = verify("ints");
    EXPECT_TRUE(ok.ok()) << ok.violation->toDiag().message;
    expectViolation("handles", VerifyDiagCode::UnresolvedTraitBound, "entry", "call");
}

TEST_F(FunctionVerifierTest, UnknownCalleeIsUnresolved)
{
    auto fb = pb.function("caller", kUnit);
    fb.call("entry", fb.state(), kRet, "nowhere", {}, {}, {}, "exit");
    expectViolation("caller", VerifyDiagCode::UnresolvedTraitBound, "entry", "call");
}

TEST_F(FunctionVerifierTest, EntryMustMatchSignature)
{
    auto fb = pb.function("early", kI32);
    auto t = fb.local("t", 4);
    fb.drop("entry", fb.state({{t, kI32}}), t, "l1")
        .assign("l1", fb.state(), kRet, Operand::constant(kI32), "exit");
    expectViolation("early", VerifyDiagCode::TypeMismatch, "entry");
}

TEST_F(FunctionVerifierTest, MalformedGraphsAreRejected)
{
    auto noEntry = pb.function("no_entry", kUnit);
    noEntry.assign("start", noEntry.state(), kRet, Operand::constant(kUnit), "exit");

    auto dangling = pb.function("dangling_label", kUnit);
    dangling.assign("entry", dangling.state(), kRet, Operand::constant(kUnit), "nowhere");

    auto exitDefined = pb.function("defines_exit", kUnit);
    exitDefined.assign("entry", exitDefined.state(), kRet, Operand::constant(kUnit), "exit")
        .assign("exit", exitDefined.state(), kRet, Operand::constant(kUnit), "entry");

    auto missingSlot = pb.function("missing_slot", kUnit);
    missingSlot.param("x", kI32);
    NodeType partial = missingSlot.state();
    partial.locations.erase(partial.locations.begin());
    missingSlot.assign("entry", partial, kRet, Operand::constant(kUnit), "exit");

    for (const char *name : {"no_entry", "dangling_label", "defines_exit", "missing_slot"})
    {
        const auto &result = verify(name);
        ASSERT_FALSE(result.ok()) << name;
        EXPECT_EQ(result.violation->code, VerifyDiagCode::MalformedContext) << name;
    }
}
