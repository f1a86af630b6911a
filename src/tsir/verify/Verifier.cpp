//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/verify/Verifier.cpp
// Purpose: Check program-wide declarations, then verify every function,
//          optionally on a pool of worker threads.
// Key invariants: Workers share only the read-only program and signature map;
//                 each writes its own result slot and its own diagnostic sink.
//                 Diagnostics are forwarded in program order after joining.
// Links: docs/tsir-verifier.md
//
//===----------------------------------------------------------------------===//

#include "tsir/verify/Verifier.hpp"

#include "tsir/core/Program.hpp"
#include "tsir/verify/DiagSink.hpp"

#include <algorithm>
#include <atomic>
#include <set>
#include <system_error>
#include <thread>
#include <utility>

namespace tsir::verify
{
namespace
{
using core::Lifetime;
using core::Location;

Violation programViolation(std::string message, support::SourceLoc loc = {})
{
    Violation v = makeViolation(VerifyDiagCode::MalformedContext, std::move(message));
    v.loc = loc;
    return v;
}

/// Build the static context; statics may only mention 'static.
VResult<LocationContext> buildStatics(const core::Program &program)
{
    LocationContext statics;
    for (const auto &decl : program.statics)
    {
        if (!decl.loc.isStatic())
            return programViolation(decl.loc.toString() + " is not a static location", decl.srcLoc);
        if (statics.contains(decl.loc))
            return programViolation("duplicate static " + decl.loc.toString(), decl.srcLoc);
        if (auto wf = program.types.checkWellFormed(decl.type); !wf)
            return programViolation(decl.loc.toString() + ": " + wf.error().message, decl.srcLoc);
        std::set<Lifetime> mentioned;
        decl.type.collectLifetimes(mentioned);
        for (const auto &lt : mentioned)
        {
            if (!lt.isStatic())
            {
                Violation v = makeViolation(VerifyDiagCode::DanglingLifetime,
                                            "static " + decl.loc.toString() +
                                                " mentions non-static lifetime " + lt.toString(),
                                            {decl.loc});
                v.loc = decl.srcLoc;
                return v;
            }
        }
        if (decl.type.isUninit())
            return programViolation("static " + decl.loc.toString() + " must be initialized",
                                    decl.srcLoc);
        statics.set(decl.loc, decl.type);
    }
    return statics;
}

/// Check extern signatures in their own generic scope.
CheckResult checkExtern(const core::Program &program, const core::FunctionSig &sig)
{
    core::TypeContext scope(&program.types);
    addGenericsToScope(sig.generics, scope);
    if (auto valid = scope.validate(); !valid)
        return programViolation("extern @" + sig.name + ": " + valid.error().message, sig.loc);

    auto check = [&](const core::Type &type) -> CheckResult
    {
        if (auto wf = scope.checkWellFormed(type); !wf)
            return programViolation("extern @" + sig.name + ": " + wf.error().message, sig.loc);
        if (!type.isAbsurd() && !scope.sizeOf(type))
            return programViolation(
                "extern @" + sig.name + ": type " + type.toString() + " has no size", sig.loc);
        return {};
    };
    for (const auto &param : sig.params)
    {
        if (auto result = check(param); !result)
            return result;
    }
    if (auto result = check(sig.ret); !result)
        return result;
    for (const auto &fact : sig.generics.outlives)
    {
        if (fact.kind == core::Outlives::Kind::Type)
        {
            if (auto result = check(fact.type); !result)
                return result;
        }
        else if (!scope.hasLifetime(fact.longer))
        {
            return programViolation("extern @" + sig.name + ": undeclared lifetime " +
                                        fact.longer.toString(),
                                    sig.loc);
        }
        if (!scope.hasLifetime(fact.shorter))
            return programViolation("extern @" + sig.name + ": undeclared lifetime " +
                                        fact.shorter.toString(),
                                    sig.loc);
    }
    return {};
}

VResult<SignatureMap> collectSignatures(const core::Program &program)
{
    SignatureMap signatures;
    for (const auto &fn : program.functions)
    {
        if (!signatures.emplace(fn.name, fn.signature()).second)
            return programViolation("duplicate function @" + fn.name, fn.loc);
    }
    for (const auto &sig : program.externs)
    {
        if (!signatures.emplace(sig.name, sig).second)
            return programViolation("duplicate function @" + sig.name, sig.loc);
        if (auto result = checkExtern(program, sig); !result)
            return result.error();
    }
    return signatures;
}

FunctionResult verifyOne(const FunctionVerifier &verifier, const core::Function &fn)
{
    FunctionResult result;
    result.function = fn.name;
    auto judgment = verifier.verify(fn);
    if (judgment)
        result.judgment = std::move(judgment.value());
    else
        result.violation = judgment.error();
    return result;
}

} // namespace

bool VerifyReport::ok() const
{
    if (programError)
        return false;
    return std::all_of(
        functions.begin(), functions.end(), [](const FunctionResult &r) { return r.ok(); });
}

std::vector<Violation> VerifyReport::violations() const
{
    std::vector<Violation> out;
    if (programError)
        out.push_back(*programError);
    for (const auto &result : functions)
    {
        if (result.violation)
            out.push_back(*result.violation);
    }
    return out;
}

VerifyReport Verifier::run(const core::Program &program,
                           const support::Options &options,
                           DiagSink *sink)
{
    VerifyReport report;
    if (auto valid = program.types.validate(); !valid)
    {
        report.programError = programViolation(valid.error().message, valid.error().loc);
        return report;
    }

    auto statics = buildStatics(program);
    if (!statics)
    {
        report.programError = statics.error();
        return report;
    }
    auto signatures = collectSignatures(program);
    if (!signatures)
    {
        report.programError = signatures.error();
        return report;
    }

    const size_t count = program.functions.size();
    const unsigned jobs = static_cast<unsigned>(
        std::min<size_t>(std::max(options.jobs, 1u), std::max<size_t>(count, 1)));
    if (options.trace && sink)
        sink->report(makeTraceNote({},
                                   "verifying " + std::to_string(count) + " functions with " +
                                       std::to_string(jobs) + " job(s)"));

    report.functions.resize(count);
    if (jobs <= 1)
    {
        const FunctionVerifier verifier(
            program.types, statics.value(), signatures.value(), options, sink);
        for (size_t i = 0; i < count; ++i)
            report.functions[i] = verifyOne(verifier, program.functions[i]);
        return report;
    }

    std::vector<CollectingDiagSink> sinks(count);
    std::atomic<size_t> next{0};
    auto worker = [&]()
    {
        for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1))
        {
            const FunctionVerifier verifier(program.types,
                                            statics.value(),
                                            signatures.value(),
                                            options,
                                            sink ? &sinks[i] : nullptr);
            report.functions[i] = verifyOne(verifier, program.functions[i]);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(jobs);
    try
    {
        for (unsigned t = 0; t < jobs; ++t)
            threads.emplace_back(worker);
    }
    catch (const std::system_error &)
    {
        // Started workers drain the shared counter; join them before unwinding.
        for (auto &thread : threads)
            thread.join();
        throw;
    }
    for (auto &thread : threads)
        thread.join();

    if (sink)
    {
        for (const auto &collected : sinks)
        {
            for (const auto &diag : collected.diagnostics())
                sink->report(diag);
        }
    }
    return report;
}

tsir::support::Expected<void> Verifier::verify(const core::Program &program)
{
    const VerifyReport report = run(program);
    const auto violations = report.violations();
    if (!violations.empty())
        return tsir::support::Expected<void>{violations.front().toDiag()};
    return {};
}

} // namespace tsir::verify
