//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the reusable pipeline behind `tsir-verify`: register the file
// with the source manager, parse it, run the verifier and print either "OK" or
// every violation. Trace notes are printed as they are forwarded by the
// verifier, which happens on the calling thread.
//
//===----------------------------------------------------------------------===//

#include "tools/tsir-verify/driver.hpp"

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "tsir/core/Program.hpp"
#include "tsir/io/Parser.hpp"
#include "tsir/verify/DiagSink.hpp"
#include "tsir/verify/Verifier.hpp"
#include "tsir/version.hpp"

#include <charconv>
#include <fstream>
#include <ostream>
#include <string>

namespace tsir::tools::verify
{
namespace
{

/// @brief Sink that prints each diagnostic as soon as it is reported.
class StreamDiagSink final : public tsir::verify::DiagSink
{
  public:
    StreamDiagSink(std::ostream &os, const tsir::support::SourceManager &sm) : os_(os), sm_(sm) {}

    void report(tsir::support::Diag diag) override
    {
        tsir::support::printDiag(diag, os_, &sm_);
    }

  private:
    std::ostream &os_;
    const tsir::support::SourceManager &sm_;
};

bool parseJobs(std::string_view text, unsigned &jobs)
{
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, jobs);
    return ec == std::errc() && ptr == last && jobs > 0;
}

void printUsage(std::ostream &err)
{
    err << "Usage: tsir-verify [--jobs N] [--trace] <file.tsir>\n"
        << "       tsir-verify --version\n";
}

} // namespace

bool runVerificationPipeline(std::string_view path,
                             const tsir::support::Options &options,
                             std::ostream &out,
                             std::ostream &err,
                             tsir::support::SourceManager &sm)
{
    const std::string pathStr(path);
    const uint32_t fileId = sm.addFile(pathStr);
    if (fileId == 0)
    {
        auto diag = tsir::support::makeError({}, "source manager exhausted file identifier space");
        tsir::support::printDiag(diag, err);
        return false;
    }

    std::ifstream input(pathStr);
    if (!input)
    {
        err << "cannot open " << pathStr << '\n';
        return false;
    }

    tsir::core::Program program;
    if (auto parsed = tsir::io::Parser::parse(input, program, fileId); !parsed)
    {
        tsir::support::printDiag(parsed.error(), err, &sm);
        return false;
    }

    StreamDiagSink sink(err, sm);
    const auto report = tsir::verify::Verifier::run(program, options, &sink);
    if (!report.ok())
    {
        tsir::support::DiagnosticEngine engine;
        for (const auto &violation : report.violations())
            engine.report(violation.toDiag());
        engine.printAll(err, &sm);
        err << engine.errorCount() << " error(s)\n";
        return false;
    }

    out << "OK\n";
    return true;
}

int runCLI(int argc,
           char **argv,
           std::ostream &out,
           std::ostream &err,
           tsir::support::SourceManager &sm)
{
    if (argc == 2 && std::string_view(argv[1]) == "--version")
    {
        out << "tsir " << TSIR_FORMAT_VERSION_STR << '\n';
        return 0;
    }

    tsir::support::Options options;
    std::string_view path;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg(argv[i]);
        if (arg == "--trace")
        {
            options.trace = true;
        }
        else if (arg == "--jobs")
        {
            if (i + 1 >= argc || !parseJobs(argv[i + 1], options.jobs))
            {
                err << "--jobs expects a positive integer\n";
                return 1;
            }
            ++i;
        }
        else if (!arg.empty() && arg.front() == '-')
        {
            err << "unknown option '" << arg << "'\n";
            printUsage(err);
            return 1;
        }
        else if (path.empty())
        {
            path = arg;
        }
        else
        {
            printUsage(err);
            return 1;
        }
    }
    if (path.empty())
    {
        printUsage(err);
        return 1;
    }

    return runVerificationPipeline(path, options, out, err, sm) ? 0 : 1;
}

} // namespace tsir::tools::verify
