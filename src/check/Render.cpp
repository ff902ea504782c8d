//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: check/Render.cpp
// Purpose: Emits the optimize and typecast renderings.
// Key invariants: The value count written by the optimize rendering is
//                 3 * values + 1, the number of trailing arguments the safe_*
//                 functions read.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "check/Render.hpp"
#include "check/IR.hpp"

#include <sstream>
#include <variant>

namespace fmtlint::check
{
namespace
{

template <typename SiteFn>
void printInterleaved(std::ostream &os, const IntermediateRepresentation &ir, SiteFn printSite)
{
    for (const auto &[chunk, site] : ir.sites())
    {
        os << chunk;
        printSite(os, site);
    }
    os << ir.last();
}

void printOptimizedSite(std::ostream &os, const Site &site)
{
    if (const auto *sp = std::get_if<SprintfSite>(&site))
        os << "safe_sprintf((char* restrict) (" << sp->buffer << "), ";
    else if (const auto *snp = std::get_if<SnprintfSite>(&site))
        os << "safe_snprintf((char* restrict) (" << snp->buffer << "), (size_t) (" << snp->bufsz
           << "), ";
    else
        os << "safe_printf(";

    const Interpolation<FormatValue> &format = siteFormat(site);
    os << format.pairs.size() * 3 + 1;
    for (const auto &[chunk, value] : format.pairs)
    {
        const lex::PrimitiveType type = value.specifier.type;
        os << ", \"" << chunk << "\", (void*) " << (type == lex::PrimitiveType::String ? "" : "&")
           << '(' << value.arg << "), " << lex::formatFunction(type);
    }
    os << ", \"" << format.last << "\")";
}

void printTypecastSite(std::ostream &os, const Site &site)
{
    if (const auto *sp = std::get_if<SprintfSite>(&site))
        os << "sprintf((char* restrict) (" << sp->buffer << "), \"";
    else if (const auto *snp = std::get_if<SnprintfSite>(&site))
        os << "snprintf((char* restrict) (" << snp->buffer << "), (size_t) (" << snp->bufsz
           << "), \"";
    else
        os << "printf(\"";

    const Interpolation<FormatValue> &format = siteFormat(site);
    for (const auto &[chunk, value] : format.pairs)
        os << chunk << '%' << value.specifier.options << lex::specifierChar(value.specifier.type);
    os << format.last << '"';

    for (const auto &pair : format.pairs)
    {
        const FormatValue &value = pair.second;
        if (value.typeChecked)
            os << ", " << value.arg;
        else
            os << ", (" << value.specifier.type << ") (" << value.arg << ')';
    }
    os << ')';
}

} // namespace

void OptimizedView::print(std::ostream &os) const
{
    printInterleaved(os, ir_, printOptimizedSite);
}

std::string OptimizedView::str() const
{
    std::ostringstream os;
    print(os);
    return os.str();
}

void TypecastView::print(std::ostream &os) const
{
    printInterleaved(os, ir_, printTypecastSite);
}

std::string TypecastView::str() const
{
    std::ostringstream os;
    print(os);
    return os.str();
}

std::ostream &operator<<(std::ostream &os, const OptimizedView &view)
{
    view.print(os);
    return os;
}

std::ostream &operator<<(std::ostream &os, const TypecastView &view)
{
    view.print(os);
    return os;
}

} // namespace fmtlint::check
