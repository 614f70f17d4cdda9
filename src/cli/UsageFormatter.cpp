//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements help and usage rendering.  Layout follows the familiar
// `usage:` / `positional arguments:` / `options:` shape so the launcher's
// output reads like other command-line tools on the same system.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Text rendering for launcher grammars.

#include "cli/UsageFormatter.hpp"

#include <filesystem>
#include <sstream>
#include <vector>

namespace novella::cli
{
namespace
{

constexpr std::size_t kLineWidth = 80;
constexpr std::size_t kHelpColumn = 24;

/// @brief Split @p text on spaces and re-flow it into lines of at most
///        @p width characters.
std::vector<std::string> wrapWords(std::string_view text, std::size_t width)
{
    std::vector<std::string> lines;
    std::string current;
    std::istringstream words{std::string(text)};
    std::string word;
    while (words >> word)
    {
        if (!current.empty() && current.size() + 1 + word.size() > width)
        {
            lines.push_back(std::move(current));
            current.clear();
        }
        if (!current.empty())
            current += ' ';
        current += word;
    }
    if (!current.empty())
        lines.push_back(std::move(current));
    return lines;
}

std::string usageFragment(const OptionSpec &spec)
{
    std::string fragment = "[" + spec.names.front();
    if (spec.kind == OptionKind::Value || spec.kind == OptionKind::IntValue)
        fragment += " " + spec.metavar;
    return fragment + "]";
}

std::string invocation(const OptionSpec &spec)
{
    std::string text;
    for (const auto &name : spec.names)
    {
        if (!text.empty())
            text += ", ";
        text += name;
        if (spec.kind == OptionKind::Value || spec.kind == OptionKind::IntValue)
            text += " " + spec.metavar;
    }
    return text;
}

/// @brief Emit one `  invocation    help` entry with help wrapped in a column.
void writeEntry(std::ostream &os, const std::string &head, const std::string &help)
{
    const std::string indent(kHelpColumn, ' ');
    std::vector<std::string> lines = wrapWords(help, kLineWidth - kHelpColumn);

    std::string first = "  " + head;
    if (lines.empty())
    {
        os << first << '\n';
        return;
    }
    if (first.size() + 2 <= kHelpColumn)
    {
        first.resize(kHelpColumn, ' ');
        os << first << lines.front() << '\n';
    }
    else
    {
        os << first << '\n' << indent << lines.front() << '\n';
    }
    for (std::size_t i = 1; i < lines.size(); ++i)
        os << indent << lines[i] << '\n';
}

void writeParagraph(std::ostream &os, std::string_view text, std::size_t indent)
{
    const std::string pad(indent, ' ');
    for (const auto &line : wrapWords(text, kLineWidth - indent))
        os << pad << line << '\n';
}

} // namespace

std::string programLabel(std::string_view argv0)
{
    if (argv0.empty())
        return "novella";
    std::string label = std::filesystem::path(std::string(argv0)).filename().string();
    return label.empty() ? std::string("novella") : label;
}

/// @brief Render the synopsis line.
/// @details Options come first in declaration order, then positionals with
///          optional ones bracketed.  Fragments wrap onto continuation lines
///          indented past `usage: prog `.
std::string formatUsage(const Grammar &grammar, std::string_view prog)
{
    std::vector<std::string> fragments;
    for (const auto &option : grammar.options())
    {
        if (!option.hidden)
            fragments.push_back(usageFragment(option));
    }
    for (const auto &positional : grammar.positionals())
    {
        fragments.push_back(positional.required ? positional.name : "[" + positional.name + "]");
    }

    const std::string lead = "usage: " + std::string(prog) + " ";
    const std::string indent(lead.size(), ' ');
    std::string out = lead;
    std::size_t column = lead.size();
    bool firstOnLine = true;
    for (const auto &fragment : fragments)
    {
        if (!firstOnLine && column + 1 + fragment.size() > kLineWidth)
        {
            out += '\n' + indent;
            column = indent.size();
            firstOnLine = true;
        }
        if (!firstOnLine)
        {
            out += ' ';
            ++column;
        }
        out += fragment;
        column += fragment.size();
        firstOnLine = false;
    }
    out += '\n';
    return out;
}

std::string formatHelp(const Grammar &grammar, std::string_view prog)
{
    std::ostringstream os;
    os << formatUsage(grammar, prog) << '\n';

    if (!grammar.description().empty())
    {
        writeParagraph(os, grammar.description(), 0);
        os << '\n';
    }

    os << "positional arguments:\n";
    for (const auto &positional : grammar.positionals())
        writeEntry(os, positional.name, positional.help);

    os << "\noptions:\n";
    for (const auto &option : grammar.options())
    {
        if (!option.hidden && !option.group)
            writeEntry(os, invocation(option), option.help);
    }

    for (std::size_t g = 0; g < grammar.groups().size(); ++g)
    {
        const OptionGroup &group = grammar.groups()[g];
        os << '\n' << group.title << ":\n";
        if (!group.description.empty())
        {
            writeParagraph(os, group.description, 2);
            os << '\n';
        }
        for (const auto &option : grammar.options())
        {
            if (!option.hidden && option.group == g)
                writeEntry(os, invocation(option), option.help);
        }
    }
    return os.str();
}

} // namespace novella::cli
