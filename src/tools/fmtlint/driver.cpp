//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the fmtlint pipeline: load the input, validate every
// printf-family call, then either report all defects or write the requested
// renderings. All state lives for the duration of one call.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Wires file loading, analysis and reporting together.

#include "driver.hpp"

#include "check/Error.hpp"
#include "check/IR.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"

#include <ostream>
#include <string>

namespace fmtlint::tools
{

int runPipeline(const CliOptions &opts, std::ostream &err)
{
    auto loaded = loadSourceFile(opts.inputPath);
    if (!loaded)
    {
        support::printDiag(loaded.error(), err);
        return 1;
    }
    const std::string &source = loaded.value();

    support::SourceManager sm;
    const uint32_t fileId = sm.addFile(opts.inputPath, source);
    if (fileId == 0)
    {
        support::printDiag(
            support::makeError(std::string{support::kSourceManagerFileIdOverflowMessage}), err);
        return 1;
    }

    auto parsed = check::IntermediateRepresentation::parse(source);
    if (!parsed)
    {
        const check::SourceErrors bundle(opts.inputPath, source, parsed.error());
        support::DiagnosticEngine engine;
        bundle.report(engine, fileId);
        err << check::SourceErrors::message() << '\n';
        engine.printAll(err, &sm);
        return 1;
    }

    const check::IntermediateRepresentation &ir = parsed.value();
    if (!opts.optimizePath.empty())
    {
        if (auto diag = writeNewFile(opts.optimizePath, ir.displayOptimize().str(), "optimize"))
        {
            support::printDiag(*diag, err);
            return 1;
        }
    }
    if (!opts.typecastPath.empty())
    {
        if (auto diag = writeNewFile(opts.typecastPath, ir.displayTypecast().str(), "typecast"))
        {
            support::printDiag(*diag, err);
            return 1;
        }
    }
    return 0;
}

} // namespace fmtlint::tools
