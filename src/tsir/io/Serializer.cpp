//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/io/Serializer.cpp
// Purpose: Print the context store, statics, externs and functions of a
//          Program in declaration order.
// Links: docs/tsir-format.md
//
//===----------------------------------------------------------------------===//

#include "tsir/io/Serializer.hpp"

#include "tsir/core/Node.hpp"
#include "tsir/core/Program.hpp"
#include "tsir/version.hpp"

#include <sstream>

namespace tsir::io
{
using namespace tsir::core;

namespace
{

void writeList(std::ostream &os, const std::vector<std::string> &items)
{
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i)
            os << ", ";
        os << items[i];
    }
}

void writeDeclParams(std::ostream &os, const UserTypeDecl &decl)
{
    if (decl.lifetimeParams.empty() && decl.typeParams.empty())
        return;
    std::vector<std::string> names;
    for (const auto &lt : decl.lifetimeParams)
        names.push_back(Lifetime::named(lt).toString());
    names.insert(names.end(), decl.typeParams.begin(), decl.typeParams.end());
    os << '<';
    writeList(os, names);
    os << '>';
}

void writeDecl(std::ostream &os, const Decl &decl)
{
    std::visit(Overload{[&](const UserTypeDecl &d)
                        {
                            if (d.parent)
                            {
                                os << "variant " << d.name;
                                writeDeclParams(os, d);
                                os << " of " << *d.parent << '\n';
                                return;
                            }
                            os << "type " << d.name;
                            writeDeclParams(os, d);
                            os << " size " << d.size << '\n';
                        },
                        [&](const ImplFact &f)
                        { os << "impl " << f.trait << " for " << f.type.toString() << '\n'; },
                        [&](const PrimOpDecl &p)
                        {
                            std::vector<std::string> params;
                            for (const auto &ty : p.params)
                                params.push_back(ty.toString());
                            os << "primop " << p.name << '(';
                            writeList(os, params);
                            os << ") -> " << p.result.toString() << '\n';
                        },
                        // Generic scopes only ever appear in function-local contexts.
                        [](const TypeParam &) {},
                        [](const LifetimeDecl &) {},
                        [](const TraitBound &) {}},
               decl);
}

void writeGenerics(std::ostream &os, const Generics &generics)
{
    if (generics.lifetimes.empty() && generics.types.empty())
        return;
    std::vector<std::string> names;
    for (const auto &lt : generics.lifetimes)
        names.push_back(lt.toString());
    for (const auto &tp : generics.types)
        names.push_back(tp.name + "[" + std::to_string(tp.size) + "]");
    os << '<';
    writeList(os, names);
    os << '>';
}

void writeWhere(std::ostream &os, const Generics &generics)
{
    if (generics.outlives.empty() && generics.traitBounds.empty())
        return;
    std::vector<std::string> clauses;
    for (const auto &fact : generics.outlives)
        clauses.push_back(fact.toString());
    for (const auto &bound : generics.traitBounds)
        clauses.push_back(bound.toString());
    os << " where ";
    writeList(os, clauses);
}

void writeExtern(std::ostream &os, const FunctionSig &sig)
{
    os << "extern fn @" << sig.name;
    writeGenerics(os, sig.generics);
    std::vector<std::string> params;
    for (const auto &ty : sig.params)
        params.push_back(ty.toString());
    os << '(';
    writeList(os, params);
    os << ") -> " << sig.ret.toString();
    writeWhere(os, sig.generics);
    os << '\n';
}

void writeFunction(std::ostream &os, const Function &fn)
{
    os << "fn @" << fn.name;
    writeGenerics(os, fn.generics);
    std::vector<std::string> params;
    for (const auto &param : fn.params)
        params.push_back(param.loc.toString() + ": " + param.type.toString());
    os << '(';
    writeList(os, params);
    os << ") -> " << fn.retType.toString();
    writeWhere(os, fn.generics);
    os << " {\n";
    if (!fn.locals.empty())
    {
        std::vector<std::string> locals;
        for (const auto &loc : fn.locals)
            locals.push_back(loc.toString());
        os << "  locals ";
        writeList(os, locals);
        os << '\n';
    }
    for (const auto &ln : fn.nodes)
    {
        os << "  " << ln.label << ": " << ln.type.toString() << '\n';
        os << "    " << ln.node.toString() << '\n';
    }
    os << "}\n";
}

} // namespace

void Serializer::write(const Program &program, std::ostream &os)
{
    os << "tsir " << (program.version.empty() ? TSIR_FORMAT_VERSION_STR : program.version)
       << '\n';
    for (const auto &decl : program.types.decls())
        writeDecl(os, decl);
    for (const auto &st : program.statics)
        os << "static " << st.loc.toString() << ": " << st.type.toString() << '\n';
    for (const auto &sig : program.externs)
        writeExtern(os, sig);
    for (const auto &fn : program.functions)
        writeFunction(os, fn);
}

std::string Serializer::toString(const Program &program)
{
    std::ostringstream os;
    write(program, os);
    return os.str();
}

} // namespace tsir::io
