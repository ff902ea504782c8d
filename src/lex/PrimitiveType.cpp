//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: lex/PrimitiveType.cpp
// Purpose: Spellings attached to each PrimitiveType.
//
//===----------------------------------------------------------------------===//

#include "lex/PrimitiveType.hpp"

namespace fmtlint::lex
{

char specifierChar(PrimitiveType type) noexcept
{
    switch (type)
    {
        case PrimitiveType::Integer:
            return 'd';
        case PrimitiveType::Float:
            return 'f';
        case PrimitiveType::String:
            return 's';
    }
    return '?';
}

std::string_view formatFunction(PrimitiveType type) noexcept
{
    switch (type)
    {
        case PrimitiveType::Integer:
            return "fmt_int";
        case PrimitiveType::Float:
            return "fmt_float";
        case PrimitiveType::String:
            return "fmt_string";
    }
    return {};
}

std::string_view typeName(PrimitiveType type) noexcept
{
    switch (type)
    {
        case PrimitiveType::Integer:
            return "int";
        case PrimitiveType::Float:
            return "float";
        case PrimitiveType::String:
            return "char*";
    }
    return {};
}

std::ostream &operator<<(std::ostream &os, PrimitiveType type)
{
    return os << typeName(type);
}

} // namespace fmtlint::lex
