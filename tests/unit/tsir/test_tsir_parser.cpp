// File: tests/unit/tsir/test_tsir_parser.cpp
// Purpose: Parse textual tsir modules and check declarations, nodes and diagnostics.
// Key invariants: Errors carry "line N:" prefixes; a parsed sample verifies cleanly
//                 and reprints to text that parses to the same output.
// Ownership/Lifetime: Each test owns its Program and input stream.
// Links: docs/tsir-format.md

#include <gtest/gtest.h>

#include "tsir/IO.hpp"
#include "tsir/core/Program.hpp"
#include "tsir/verify/Verifier.hpp"

#include <optional>
#include <sstream>
#include <string>
#include <variant>

using namespace tsir::core;
using tsir::io::Parser;
using tsir::io::Serializer;

namespace
{

constexpr const char *kSample = R"(tsir 0.1
# scalar and enum types
type bool size 1
type i32 size 4
type unit size 0
type Shape size 8
variant Circle of Shape
variant Square of Shape
type Box<T> size 8
type Ref<'r, T> size 8
impl Copy for i32
impl Copy for bool
impl Copy for Ref<'_, i32>
primop add(i32, i32) -> i32
static @LIMIT: i32
extern fn free<T[8]>(Box<T>) -> unit

fn @inc($x: i32) -> i32 {
  entry: [$x: i32, ret: uninit<4>; 'static; ]
    assign ret = add($x, @LIMIT) -> drop_x
  drop_x: [$x: i32, ret: i32; 'static; ] drop $x -> exit
}

fn @release<T[8]>($b: Box<T>) -> unit {
  entry: [$b: Box<T>, ret: uninit<0>; 'static; ]
    call ret = @free<T>($b) -> exit
}

fn @pick($s: Shape) -> Shape {
  locals %t
  entry: [$s: Shape, %t: uninit<8>, ret: uninit<8>; 'static; ]
    switch $s: Shape { Circle -> round, Square -> square }
  round: [$s: Circle, %t: uninit<8>, ret: uninit<8>; 'static; ]
    assign ret = $s -> exit
  square: [$s: Square, %t: uninit<8>, ret: uninit<8>; 'static; ]
    assign %t = $s -> out
  out: [$s: uninit<8>, %t: Square, ret: uninit<8>; 'static; ]
    assign ret = %t -> exit
}

fn @borrow<'a>($r: Ref<'a, i32>) -> Ref<'a, i32> {
  entry: [$r: Ref<'a, i32>, ret: uninit<8>; 'static, 'a; ]
    assign ret = $r -> done
  done: [$r: Ref<'a, i32>, ret: Ref<'a, i32>; 'static, 'a; ]
    drop $r -> exit
}

fn @scoped() -> unit {
  locals %r
  entry: [%r: uninit<8>, ret: uninit<0>; 'static; ]
    begin 'l -> make
  make: [%r: uninit<8>, ret: uninit<0>; 'static, 'l; ]
    assign %r = const Ref<'l, i32> -> consume
  consume: [%r: Ref<'l, i32>, ret: uninit<0>; 'static, 'l; ]
    drop %r -> close
  close: [%r: uninit<8>, ret: uninit<0>; 'static, 'l; ]
    end 'l -> finish
  finish: [%r: uninit<8>, ret: uninit<0>; 'static; ]
    assign ret = const unit -> exit
}
)";

tsir::support::Expected<void> parseText(const std::string &text, Program &program)
{
    std::istringstream in(text);
    return Parser::parse(in, program);
}

/// Parse @p text and return the error message, or an empty string on success.
std::string parseError(const std::string &text)
{
    Program program;
    auto result = parseText(text, program);
    if (result)
        return {};
    return result.error().message;
}

} // namespace

TEST(TsirParser, ParsesDeclarationsAndFunctions)
{
    Program program;
    auto result = parseText(kSample, program);
    ASSERT_TRUE(result) << result.error().message;

    EXPECT_EQ(program.version, "0.1");
    ASSERT_NE(program.types.findUserType("Circle"), nullptr);
    EXPECT_EQ(program.types.findUserType("Circle")->parent, std::optional<std::string>("Shape"));
    EXPECT_EQ(program.types.findUserType("Circle")->size, 8u);
    ASSERT_NE(program.types.findUserType("Ref"), nullptr);
    EXPECT_EQ(program.types.findUserType("Ref")->lifetimeParams.size(), 1u);
    ASSERT_NE(program.types.findPrimOp("add"), nullptr);
    EXPECT_EQ(program.types.findPrimOp("add")->params.size(), 2u);

    ASSERT_EQ(program.statics.size(), 1u);
    EXPECT_EQ(program.statics[0].loc.toString(), "@LIMIT");
    ASSERT_EQ(program.externs.size(), 1u);
    EXPECT_EQ(program.externs[0].name, "free");
    ASSERT_EQ(program.externs[0].generics.types.size(), 1u);
    EXPECT_EQ(program.externs[0].generics.types[0].size, 8u);

    ASSERT_EQ(program.functions.size(), 5u);
    const Function &inc = program.functions[0];
    EXPECT_EQ(inc.name, "inc");
    ASSERT_EQ(inc.params.size(), 1u);
    EXPECT_EQ(inc.params[0].type, Type::user("i32"));
    ASSERT_EQ(inc.nodes.size(), 2u);
    EXPECT_EQ(inc.nodes[0].label, "entry");
    const auto *assign = std::get_if<AssignNode>(&inc.nodes[0].node.kind);
    ASSERT_NE(assign, nullptr);
    EXPECT_EQ(assign->value.kind, Rvalue::Kind::Binary);
    EXPECT_EQ(assign->value.op, "add");
    EXPECT_EQ(assign->next, "drop_x");
    EXPECT_TRUE(std::holds_alternative<DropNode>(inc.nodes[1].node.kind));

    const Function &release = program.functions[1];
    ASSERT_EQ(release.generics.types.size(), 1u);
    EXPECT_EQ(release.params[0].type, Type::user("Box", {}, {Type::param("T")}));
    const auto *call = std::get_if<CallNode>(&release.nodes[0].node.kind);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->callee, "free");
    ASSERT_EQ(call->typeArgs.size(), 1u);
    EXPECT_EQ(call->typeArgs[0], Type::param("T"));

    const Function &pick = program.functions[2];
    ASSERT_EQ(pick.locals.size(), 1u);
    const auto *sw = std::get_if<SwitchNode>(&pick.nodes[0].node.kind);
    ASSERT_NE(sw, nullptr);
    ASSERT_EQ(sw->arms.size(), 2u);
    EXPECT_EQ(sw->arms[1].type, Type::user("Square"));
    EXPECT_EQ(sw->arms[1].label, "square");

    const Function &scoped = program.functions[4];
    EXPECT_TRUE(std::holds_alternative<LifetimeBeginNode>(scoped.nodes[0].node.kind));
    EXPECT_TRUE(std::holds_alternative<LifetimeEndNode>(scoped.nodes[3].node.kind));
    EXPECT_EQ(scoped.nodes[2].type.lifetimes.size(), 2u);
}

TEST(TsirParser, RecordsSourcePositions)
{
    Program program;
    std::istringstream in(kSample);
    ASSERT_TRUE(Parser::parse(in, program, 3));

    const Function &inc = program.functions[0];
    EXPECT_EQ(inc.loc.file_id, 3u);
    EXPECT_EQ(inc.loc.line, 18u);
    EXPECT_EQ(inc.nodes[0].node.loc.line, 20u);
    EXPECT_EQ(inc.nodes[0].node.loc.column, 5u);
    EXPECT_EQ(inc.nodes[1].node.loc.line, 21u);
}

TEST(TsirParser, ParsedSampleVerifies)
{
    Program program;
    ASSERT_TRUE(parseText(kSample, program));

    const auto report = tsir::verify::Verifier::run(program);
    for (const auto &violation : report.violations())
        ADD_FAILURE() << violation.toDiag().message;
    EXPECT_TRUE(report.ok());
    ASSERT_EQ(report.functions.size(), 5u);
    EXPECT_EQ(report.functions[1].judgment->toString(),
              "forall<T> . fn @release(Box<T>) -> unit");
}

TEST(TsirParser, SerializedTextParsesBack)
{
    Program first;
    ASSERT_TRUE(parseText(kSample, first));
    const std::string text = Serializer::toString(first);
    EXPECT_EQ(text.rfind("tsir 0.1\n", 0), 0u);

    Program second;
    auto reparsed = parseText(text, second);
    ASSERT_TRUE(reparsed) << reparsed.error().message;
    EXPECT_EQ(Serializer::toString(second), text);
    EXPECT_EQ(second.functions.size(), first.functions.size());
}

TEST(TsirParser, RequiresVersionBanner)
{
    EXPECT_EQ(parseError("type i32 size 4\n"), "line 1: missing 'tsir' version directive");
    EXPECT_NE(parseError("# only a comment\n").find("missing 'tsir' version directive"),
              std::string::npos);
    EXPECT_NE(parseError("tsir 9.9\n").find("unsupported format version '9.9'"),
              std::string::npos);
    EXPECT_NE(parseError("tsir 0.1\ntsir 0.1\n").find("duplicate 'tsir' version directive"),
              std::string::npos);
}

TEST(TsirParser, ReportsMalformedBodies)
{
    const std::string header = "tsir 0.1\ntype unit size 0\n";

    EXPECT_EQ(parseError(header + "fn @f() -> unit {\n"
                                  "  entry: [ret: uninit<0>; 'static; ]\n"
                                  "}\n"),
              "line 5: label 'entry' has no node");

    EXPECT_EQ(parseError(header + "fn @f() -> unit {\n"
                                  "  entry: [ret: uninit<0>; 'static; ] unreachable\n"),
              "line 4: missing '}' at end of function '@f'");

    const std::string unknown = parseError(header + "fn @f() -> unit {\n"
                                                    "  entry: [ret: uninit<0>; 'static; ]\n"
                                                    "    jump exit\n"
                                                    "}\n");
    EXPECT_EQ(unknown.rfind("line 5:", 0), 0u) << unknown;
    EXPECT_NE(unknown.find("unknown node 'jump exit'"), std::string::npos) << unknown;

    EXPECT_NE(parseError(header + "frobnicate\n").find("line 3: unexpected line"),
              std::string::npos);
}

TEST(TsirParser, RejectsBadSlotSpellings)
{
    const std::string header = "tsir 0.1\ntype i32 size 4\n";
    EXPECT_NE(parseError(header + "static LIMIT: i32\n").find("line 3:"), std::string::npos);
    EXPECT_NE(parseError(header + "fn @f(%x: i32) -> i32 {\n}\n")
                  .find("parameters must be written $name"),
              std::string::npos);
    EXPECT_NE(parseError(header + "fn @f() -> i32 {\n  locals $x\n}\n")
                  .find("locals must be written %name"),
              std::string::npos);
}
