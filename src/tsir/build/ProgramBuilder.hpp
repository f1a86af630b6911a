//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares ProgramBuilder and FunctionBuilder, a small API for
// constructing typestate programs in memory. Tests and embedders use it in
// place of .tsir text.
//
// The builders only assemble data; they never verify. Malformed programs can
// be built on purpose so that the verifier's rejections can be exercised.
//
// Typical Usage Pattern:
//   Program program;
//   ProgramBuilder pb(program);
//   pb.type("i32", 4).impl("Copy", Type::user("i32"));
//   auto fb = pb.function("id", Type::user("i32"));
//   auto x = fb.param("x", Type::user("i32"));
//   fb.assign("entry", fb.state({{x, Type::user("i32")}}), Location::returnSlot(),
//             Operand::use(x), "l1");
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tsir/core/Program.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace tsir::build
{

/// @brief Appends generics, slots and labelled nodes to one function of a
///        Program.
/// @details Holds the program by reference and the function by index, so the
///          builder stays valid while further functions are added.
class FunctionBuilder
{
  public:
    FunctionBuilder(core::Program &program, size_t index);

    core::Function &function();

    FunctionBuilder &lifetime(std::string name);
    FunctionBuilder &typeParam(std::string name, uint64_t size);
    FunctionBuilder &where(core::Outlives fact);
    FunctionBuilder &where(core::TraitBound bound);

    core::Location param(std::string name, core::Type type);

    /// @brief Declare local %name whose uninitialised form is `uninit<size>`.
    core::Location local(std::string name, uint64_t size);

    /// @brief Node type in which every slot is uninitialised except @p live.
    /// @details Lifetimes are 'static, the function's lifetime parameters and
    ///          @p extraLifetimes; bounds are the where-clause facts followed
    ///          by @p extraBounds.
    core::NodeType state(std::vector<core::LocationBinding> live = {},
                         std::vector<core::Lifetime> extraLifetimes = {},
                         std::vector<core::Outlives> extraBounds = {}) const;

    FunctionBuilder &node(std::string label, core::NodeType type, core::NodeKind kind);

    FunctionBuilder &assign(std::string label,
                            core::NodeType type,
                            core::Location dest,
                            core::Operand value,
                            std::string next);

    FunctionBuilder &assignOp(std::string label,
                              core::NodeType type,
                              core::Location dest,
                              std::string op,
                              std::vector<core::Operand> operands,
                              std::string next);

    FunctionBuilder &call(std::string label,
                          core::NodeType type,
                          core::Location dest,
                          std::string callee,
                          std::vector<core::Lifetime> lifetimeArgs,
                          std::vector<core::Type> typeArgs,
                          std::vector<core::Operand> args,
                          std::string next);

    FunctionBuilder &drop(std::string label,
                          core::NodeType type,
                          core::Location target,
                          std::string next);

    FunctionBuilder &begin(std::string label,
                           core::NodeType type,
                           core::Lifetime lt,
                           std::string next);

    FunctionBuilder &end(std::string label,
                         core::NodeType type,
                         core::Lifetime lt,
                         std::string next);

    FunctionBuilder &unreachable(std::string label, core::NodeType type);

  private:
    uint64_t sizeOf(const core::Type &type) const;

    core::Program &program_;
    size_t index_;
    std::map<std::string, uint64_t> localSizes_;
};

/// @brief Appends declarations and functions to a Program.
class ProgramBuilder
{
  public:
    explicit ProgramBuilder(core::Program &program);

    ProgramBuilder &type(std::string name,
                         uint64_t size,
                         std::vector<std::string> lifetimeParams = {},
                         std::vector<std::string> typeParams = {});

    /// @brief Declare @p name as a variant of enum @p parent, taking the
    ///        parent's parameters and size.
    ProgramBuilder &variant(std::string name, std::string parent);

    ProgramBuilder &impl(std::string trait, core::Type type);

    ProgramBuilder &primop(std::string name, std::vector<core::Type> params, core::Type result);

    core::Location addStatic(std::string name, core::Type type);

    ProgramBuilder &addExtern(core::FunctionSig sig);

    FunctionBuilder function(std::string name, core::Type ret);

  private:
    core::Program &program_;
};

} // namespace tsir::build
