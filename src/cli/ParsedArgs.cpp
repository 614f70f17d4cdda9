//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Maps grammar destination names onto ParsedArgs fields.  Global options have
// dedicated members; anything else lands in the extras table, which is how
// command-scoped grammars carry their own flags without widening the record.
//
//===----------------------------------------------------------------------===//

#include "cli/ParsedArgs.hpp"

#include <array>
#include <utility>

namespace novella::cli
{
namespace
{

struct BoolField
{
    std::string_view dest;
    bool ParsedArgs::*member;
};

struct OptionalTextField
{
    std::string_view dest;
    std::optional<std::string> ParsedArgs::*member;
};

constexpr std::array<BoolField, 8> kBoolFields{{
    {"compile", &ParsedArgs::compile},
    {"compile_python", &ParsedArgs::compilePython},
    {"keep_orphan_rpyc", &ParsedArgs::keepOrphanRpyc},
    {"lint", &ParsedArgs::lint},
    {"errors_in_editor", &ParsedArgs::errorsInEditor},
    {"safe_mode", &ParsedArgs::safeMode},
    {"json_dump_private", &ParsedArgs::jsonDumpPrivate},
    {"json_dump_common", &ParsedArgs::jsonDumpCommon},
}};

constexpr std::array<OptionalTextField, 3> kTextFields{{
    {"savedir", &ParsedArgs::savedir},
    {"warp", &ParsedArgs::warp},
    {"json_dump", &ParsedArgs::jsonDump},
}};

} // namespace

bool ParsedArgs::flag(std::string_view dest) const
{
    auto it = extras.find(dest);
    if (it == extras.end())
        return false;
    const bool *value = std::get_if<bool>(&it->second);
    return value != nullptr && *value;
}

std::optional<std::string> ParsedArgs::text(std::string_view dest) const
{
    auto it = extras.find(dest);
    if (it == extras.end())
        return std::nullopt;
    if (const std::string *value = std::get_if<std::string>(&it->second))
        return *value;
    return std::nullopt;
}

void ParsedArgs::assign(std::string_view dest, OptionValue value)
{
    if (dest == "basedir")
    {
        basedir = std::get<std::string>(std::move(value));
        return;
    }
    if (dest == "command")
    {
        command = std::get<std::string>(std::move(value));
        return;
    }
    if (dest == "trace")
    {
        trace = std::get<std::int64_t>(value);
        return;
    }
    for (const auto &field : kBoolFields)
    {
        if (field.dest == dest)
        {
            this->*field.member = std::get<bool>(value);
            return;
        }
    }
    for (const auto &field : kTextFields)
    {
        if (field.dest == dest)
        {
            this->*field.member = std::get<std::string>(std::move(value));
            return;
        }
    }
    extras.insert_or_assign(std::string(dest), std::move(value));
}

} // namespace novella::cli
