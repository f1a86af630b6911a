// File: tests/unit/tsir/test_tsir_verifier.cpp
// Purpose: Exercise program-wide checks, report aggregation, worker fan-out and tracing.
// Key invariants: Program errors suppress function checks; results keep program
//                 order for any worker count.
// Ownership/Lifetime: Each test owns its Program and sinks.
// Links: docs/tsir-verifier.md

#include <gtest/gtest.h>

#include "support/options.hpp"
#include "tsir/build/ProgramBuilder.hpp"
#include "tsir/verify/DiagSink.hpp"
#include "tsir/verify/Verifier.hpp"

#include <string>
#include <vector>

using namespace tsir::core;
using tsir::build::ProgramBuilder;
using tsir::support::Options;
using tsir::support::Severity;
using tsir::verify::CollectingDiagSink;
using tsir::verify::Verifier;
using tsir::verify::VerifyDiagCode;
using tsir::verify::VerifyReport;

namespace
{

const Type kI32 = Type::user("i32");
const Type kBox = Type::user("Box");
const Type kUnit = Type::user("unit");
const Location kRet = Location::returnSlot();

class VerifierTest : public ::testing::Test
{
  protected:
    VerifierTest() : pb(program)
    {
        pb.type("i32", 4).type("unit", 0).type("Box", 8).type("Ref", 8, {"r"}, {"T"});
        pb.impl("Copy", kI32);
    }

    /// Add `fn @name($b: Box) -> Box` that moves its argument out.
    void addPass(const std::string &name)
    {
        auto fb = pb.function(name, kBox);
        auto b = fb.param("b", kBox);
        fb.assign("entry", fb.state({{b, kBox}}), kRet, Operand::use(b), "exit");
    }

    /// Add `fn @name($b: Box) -> unit` that forgets to consume its argument.
    void addLeak(const std::string &name)
    {
        auto fb = pb.function(name, kUnit);
        auto b = fb.param("b", kBox);
        fb.assign("entry", fb.state({{b, kBox}}), kRet, Operand::constant(kUnit), "exit");
    }

    Program program;
    ProgramBuilder pb;
};

/// Render a report as one line per function for order-sensitive comparison.
std::vector<std::string> summarize(const VerifyReport &report)
{
    std::vector<std::string> lines;
    for (const auto &result : report.functions)
    {
        if (result.ok())
            lines.push_back(result.judgment->toString());
        else
            lines.push_back(result.violation->toDiag().message);
    }
    return lines;
}

} // namespace

TEST_F(VerifierTest, AcceptsEveryWellTypedFunction)
{
    addPass("a");
    addPass("b");

    const VerifyReport report = Verifier::run(program);
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.violations().empty());
    ASSERT_EQ(report.functions.size(), 2u);
    EXPECT_EQ(report.functions[0].function, "a");
    EXPECT_EQ(report.functions[1].function, "b");
    EXPECT_TRUE(Verifier::verify(program));
}

TEST_F(VerifierTest, ReportsEveryFailingFunction)
{
    addLeak("first");
    addPass("middle");
    addLeak("last");

    const VerifyReport report = Verifier::run(program);
    EXPECT_FALSE(report.ok());
    ASSERT_EQ(report.functions.size(), 3u);
    EXPECT_FALSE(report.functions[0].ok());
    EXPECT_TRUE(report.functions[1].ok());
    EXPECT_FALSE(report.functions[2].ok());

    const auto violations = report.violations();
    ASSERT_EQ(violations.size(), 2u);
    EXPECT_EQ(violations[0].function, "first");
    EXPECT_EQ(violations[1].function, "last");

    auto result = Verifier::verify(program);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().severity, Severity::Error);
    EXPECT_EQ(result.error().message.rfind("verify.type_mismatch: @first:entry:", 0), 0u)
        << result.error().message;
}

TEST_F(VerifierTest, DuplicateFunctionIsProgramError)
{
    addPass("twin");
    addPass("twin");

    const VerifyReport report = Verifier::run(program);
    ASSERT_TRUE(report.programError.has_value());
    EXPECT_EQ(report.programError->code, VerifyDiagCode::MalformedContext);
    EXPECT_EQ(report.programError->message, "duplicate function @twin");
    EXPECT_TRUE(report.functions.empty());
    EXPECT_FALSE(report.ok());

    auto result = Verifier::verify(program);
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().message.find("verify.malformed_context"), std::string::npos);
}

TEST_F(VerifierTest, ExternNameClashesWithDefinition)
{
    addPass("free");
    FunctionSig sig;
    sig.name = "free";
    sig.params = {kBox};
    sig.ret = kUnit;
    pb.addExtern(sig);

    const VerifyReport report = Verifier::run(program);
    ASSERT_TRUE(report.programError.has_value());
    EXPECT_EQ(report.programError->message, "duplicate function @free");
}

TEST_F(VerifierTest, ExternSignaturesAreWellFormed)
{
    FunctionSig sig;
    sig.name = "peek";
    sig.params = {Type::user("Ref", {Lifetime::named("a")}, {kI32})};
    sig.ret = kI32;
    pb.addExtern(sig);

    const VerifyReport report = Verifier::run(program);
    ASSERT_TRUE(report.programError.has_value());
    EXPECT_EQ(report.programError->message.rfind("extern @peek: ", 0), 0u)
        << report.programError->message;
}

TEST_F(VerifierTest, StaticsAreCheckedBeforeFunctions)
{
    pb.addStatic("ANCHOR", Type::user("Ref", {Lifetime::staticLifetime()}, {kI32}));
    addPass("ok");
    EXPECT_TRUE(Verifier::run(program).ok());

    pb.addStatic("LOOSE", Type::user("Ref", {Lifetime::named("a")}, {kI32}));
    const VerifyReport report = Verifier::run(program);
    ASSERT_TRUE(report.programError.has_value());
    EXPECT_NE(report.programError->message.find("@LOOSE"), std::string::npos)
        << report.programError->message;
    EXPECT_TRUE(report.functions.empty());
}

TEST_F(VerifierTest, StaticMustBeInitialized)
{
    pb.addStatic("EMPTY", Type::uninit(4));
    const VerifyReport report = Verifier::run(program);
    ASSERT_TRUE(report.programError.has_value());
    EXPECT_EQ(report.programError->message, "static @EMPTY must be initialized");
}

TEST_F(VerifierTest, InvalidTypeStoreIsProgramError)
{
    pb.variant("Stray", "Missing");
    addPass("ok");

    const VerifyReport report = Verifier::run(program);
    ASSERT_TRUE(report.programError.has_value());
    EXPECT_NE(report.programError->message.find("variant 'Stray' of undeclared type 'Missing'"),
              std::string::npos)
        << report.programError->message;
}

TEST_F(VerifierTest, WorkerCountDoesNotChangeResults)
{
    for (int i = 0; i < 12; ++i)
    {
        if (i % 3 == 0)
            addLeak("leak" + std::to_string(i));
        else
            addPass("pass" + std::to_string(i));
    }

    const VerifyReport serial = Verifier::run(program);
    Options options;
    options.jobs = 4;
    const VerifyReport parallel = Verifier::run(program, options);

    EXPECT_EQ(summarize(serial), summarize(parallel));
    ASSERT_EQ(parallel.functions.size(), 12u);
    for (size_t i = 0; i < parallel.functions.size(); ++i)
        EXPECT_EQ(parallel.functions[i].function, program.functions[i].name);
    EXPECT_EQ(parallel.violations().size(), 4u);
}

TEST_F(VerifierTest, TraceNotesFollowProgramOrder)
{
    addPass("a");
    addPass("b");

    Options options;
    options.trace = true;
    options.jobs = 2;
    CollectingDiagSink sink;
    ASSERT_TRUE(Verifier::run(program, options, &sink).ok());

    const auto &diags = sink.diagnostics();
    ASSERT_FALSE(diags.empty());
    EXPECT_EQ(diags.front().message, "verifying 2 functions with 2 job(s)");

    std::vector<std::string> messages;
    for (const auto &diag : diags)
    {
        EXPECT_EQ(diag.severity, Severity::Note);
        messages.push_back(diag.message);
    }
    const auto find = [&](const std::string &text)
    {
        for (size_t i = 0; i < messages.size(); ++i)
        {
            if (messages[i] == text)
                return static_cast<long>(i);
        }
        return -1L;
    };
    const long nodeA = find("@a:entry: assign ret = $b -> exit");
    const long doneA = find("verified fn @a(Box) -> Box");
    const long nodeB = find("@b:entry: assign ret = $b -> exit");
    const long doneB = find("verified fn @b(Box) -> Box");
    ASSERT_GE(nodeA, 0);
    ASSERT_GE(doneA, 0);
    ASSERT_GE(nodeB, 0);
    ASSERT_GE(doneB, 0);
    EXPECT_LT(nodeA, doneA);
    EXPECT_LT(doneA, nodeB);
    EXPECT_LT(nodeB, doneB);
}

TEST_F(VerifierTest, TraceIsSilentWhenDisabled)
{
    addPass("a");
    CollectingDiagSink sink;
    ASSERT_TRUE(Verifier::run(program, Options{}, &sink).ok());
    EXPECT_TRUE(sink.diagnostics().empty());
}
