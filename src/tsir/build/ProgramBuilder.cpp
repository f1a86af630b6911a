//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/build/ProgramBuilder.cpp
// Purpose: Implement the in-memory program and function builders.
// Key invariants: Slots are recorded in declaration order; state() always
//                 lists params, then locals, then ret.
// Ownership/Lifetime: Builders mutate a caller-owned Program.
//
//===----------------------------------------------------------------------===//

#include "tsir/build/ProgramBuilder.hpp"

#include "tsir/version.hpp"

#include <utility>

namespace tsir::build
{
using namespace tsir::core;

FunctionBuilder::FunctionBuilder(Program &program, size_t index)
    : program_(program), index_(index)
{
}

Function &FunctionBuilder::function()
{
    return program_.functions[index_];
}

FunctionBuilder &FunctionBuilder::lifetime(std::string name)
{
    function().generics.lifetimes.push_back(Lifetime::named(std::move(name)));
    return *this;
}

FunctionBuilder &FunctionBuilder::typeParam(std::string name, uint64_t size)
{
    function().generics.types.push_back(TypeParam{std::move(name), size});
    return *this;
}

FunctionBuilder &FunctionBuilder::where(Outlives fact)
{
    function().generics.outlives.push_back(std::move(fact));
    return *this;
}

FunctionBuilder &FunctionBuilder::where(TraitBound bound)
{
    function().generics.traitBounds.push_back(std::move(bound));
    return *this;
}

Location FunctionBuilder::param(std::string name, Type type)
{
    Location loc = Location::param(std::move(name));
    function().params.push_back(Param{loc, std::move(type)});
    return loc;
}

Location FunctionBuilder::local(std::string name, uint64_t size)
{
    localSizes_[name] = size;
    Location loc = Location::local(std::move(name));
    function().locals.push_back(loc);
    return loc;
}

uint64_t FunctionBuilder::sizeOf(const Type &type) const
{
    const Function &fn = program_.functions[index_];
    if (type.kind == Type::Kind::Param)
    {
        for (const auto &tp : fn.generics.types)
        {
            if (tp.name == type.name)
                return tp.size;
        }
        return 0;
    }
    return program_.types.sizeOf(type).value_or(0);
}

NodeType FunctionBuilder::state(std::vector<LocationBinding> live,
                                std::vector<Lifetime> extraLifetimes,
                                std::vector<Outlives> extraBounds) const
{
    const Function &fn = program_.functions[index_];
    auto typeFor = [&](const Location &loc, uint64_t size)
    {
        for (const auto &binding : live)
        {
            if (binding.loc == loc)
                return binding.type;
        }
        return Type::uninit(size);
    };

    NodeType out;
    for (const auto &p : fn.params)
        out.locations.push_back(LocationBinding{p.loc, typeFor(p.loc, sizeOf(p.type))});
    for (const auto &loc : fn.locals)
    {
        auto it = localSizes_.find(loc.name);
        const uint64_t size = it == localSizes_.end() ? 0 : it->second;
        out.locations.push_back(LocationBinding{loc, typeFor(loc, size)});
    }
    const Location ret = Location::returnSlot();
    out.locations.push_back(LocationBinding{ret, typeFor(ret, sizeOf(fn.retType))});

    out.lifetimes.push_back(Lifetime::staticLifetime());
    out.lifetimes.insert(
        out.lifetimes.end(), fn.generics.lifetimes.begin(), fn.generics.lifetimes.end());
    out.lifetimes.insert(out.lifetimes.end(), extraLifetimes.begin(), extraLifetimes.end());

    out.bounds = fn.generics.outlives;
    out.bounds.insert(out.bounds.end(), extraBounds.begin(), extraBounds.end());
    return out;
}

FunctionBuilder &FunctionBuilder::node(std::string label, NodeType type, NodeKind kind)
{
    function().nodes.push_back(
        LabeledNode{std::move(label), std::move(type), Node{std::move(kind), {}}});
    return *this;
}

FunctionBuilder &FunctionBuilder::assign(
    std::string label, NodeType type, Location dest, Operand value, std::string next)
{
    Rvalue rv;
    rv.operands.push_back(std::move(value));
    return node(std::move(label),
                std::move(type),
                AssignNode{std::move(dest), std::move(rv), std::move(next)});
}

FunctionBuilder &FunctionBuilder::assignOp(std::string label,
                                           NodeType type,
                                           Location dest,
                                           std::string op,
                                           std::vector<Operand> operands,
                                           std::string next)
{
    Rvalue rv;
    rv.kind = operands.size() == 1 ? Rvalue::Kind::Unary : Rvalue::Kind::Binary;
    rv.op = std::move(op);
    rv.operands = std::move(operands);
    return node(std::move(label),
                std::move(type),
                AssignNode{std::move(dest), std::move(rv), std::move(next)});
}

FunctionBuilder &FunctionBuilder::call(std::string label,
                                       NodeType type,
                                       Location dest,
                                       std::string callee,
                                       std::vector<Lifetime> lifetimeArgs,
                                       std::vector<Type> typeArgs,
                                       std::vector<Operand> args,
                                       std::string next)
{
    return node(std::move(label),
                std::move(type),
                CallNode{std::move(dest),
                         std::move(callee),
                         std::move(lifetimeArgs),
                         std::move(typeArgs),
                         std::move(args),
                         std::move(next)});
}

FunctionBuilder &FunctionBuilder::drop(std::string label,
                                       NodeType type,
                                       Location target,
                                       std::string next)
{
    return node(std::move(label), std::move(type), DropNode{std::move(target), std::move(next)});
}

FunctionBuilder &FunctionBuilder::begin(std::string label,
                                        NodeType type,
                                        Lifetime lt,
                                        std::string next)
{
    return node(
        std::move(label), std::move(type), LifetimeBeginNode{std::move(lt), std::move(next)});
}

FunctionBuilder &FunctionBuilder::end(std::string label,
                                      NodeType type,
                                      Lifetime lt,
                                      std::string next)
{
    return node(
        std::move(label), std::move(type), LifetimeEndNode{std::move(lt), std::move(next)});
}

FunctionBuilder &FunctionBuilder::unreachable(std::string label, NodeType type)
{
    return node(std::move(label), std::move(type), DeadCodeNode{});
}

ProgramBuilder::ProgramBuilder(Program &program) : program_(program)
{
    if (program_.version.empty())
        program_.version = TSIR_FORMAT_VERSION_STR;
}

ProgramBuilder &ProgramBuilder::type(std::string name,
                                     uint64_t size,
                                     std::vector<std::string> lifetimeParams,
                                     std::vector<std::string> typeParams)
{
    UserTypeDecl decl;
    decl.name = std::move(name);
    decl.size = size;
    decl.lifetimeParams = std::move(lifetimeParams);
    decl.typeParams = std::move(typeParams);
    program_.types.addUserType(std::move(decl));
    return *this;
}

ProgramBuilder &ProgramBuilder::variant(std::string name, std::string parent)
{
    UserTypeDecl decl;
    decl.name = std::move(name);
    if (const UserTypeDecl *enumDecl = program_.types.findUserType(parent))
    {
        decl.size = enumDecl->size;
        decl.lifetimeParams = enumDecl->lifetimeParams;
        decl.typeParams = enumDecl->typeParams;
    }
    decl.parent = std::move(parent);
    program_.types.addUserType(std::move(decl));
    return *this;
}

ProgramBuilder &ProgramBuilder::impl(std::string trait, Type type)
{
    program_.types.addImpl(ImplFact{std::move(trait), std::move(type), {}});
    return *this;
}

ProgramBuilder &ProgramBuilder::primop(std::string name, std::vector<Type> params, Type result)
{
    program_.types.addPrimOp(PrimOpDecl{std::move(name), std::move(params), std::move(result), {}});
    return *this;
}

Location ProgramBuilder::addStatic(std::string name, Type type)
{
    Location loc = Location::staticVar(std::move(name));
    program_.statics.push_back(StaticDecl{loc, std::move(type), {}});
    return loc;
}

ProgramBuilder &ProgramBuilder::addExtern(FunctionSig sig)
{
    program_.externs.push_back(std::move(sig));
    return *this;
}

FunctionBuilder ProgramBuilder::function(std::string name, Type ret)
{
    Function fn;
    fn.name = std::move(name);
    fn.retType = std::move(ret);
    program_.functions.push_back(std::move(fn));
    return FunctionBuilder(program_, program_.functions.size() - 1);
}

} // namespace tsir::build
