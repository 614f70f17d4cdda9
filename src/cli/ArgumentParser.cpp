//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the single parse routine shared by the bootstrap and dispatch
// passes.  The grammar decides everything mode-specific: which options exist,
// whether positionals are required, and whether leftovers are an error.  The
// routine itself holds no state between calls.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Token scanner that applies a Grammar to an argument list.

#include "cli/ArgumentParser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <system_error>
#include <utility>

namespace novella::cli
{
namespace
{

using support::Diag;
using support::makeError;

/// @brief Token paired with its position on the command line.
struct IndexedToken
{
    std::size_t index;
    std::string text;
};

bool allDigits(std::string_view text)
{
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch); });
}

/// @brief Match `-123` and `-1.5` / `-.5` the way option scanners treat them.
bool isNegativeNumber(std::string_view token)
{
    if (token.size() < 2 || token.front() != '-')
        return false;
    const std::string_view body = token.substr(1);
    const auto dot = body.find('.');
    if (dot == std::string_view::npos)
        return allDigits(body);
    const std::string_view whole = body.substr(0, dot);
    const std::string_view frac = body.substr(dot + 1);
    return (whole.empty() || allDigits(whole)) && allDigits(frac);
}

bool looksLikeOption(std::string_view token)
{
    return token.size() > 1 && token.front() == '-' && !isNegativeNumber(token);
}

std::string displayName(const OptionSpec &spec)
{
    std::string joined;
    for (const auto &name : spec.names)
    {
        if (!joined.empty())
            joined += '/';
        joined += name;
    }
    return joined;
}

Diag optionError(const OptionSpec &spec, std::string_view what)
{
    return makeError("argument " + displayName(spec) + ": " + std::string(what));
}

std::string joinTokens(const std::vector<std::string> &tokens, std::string_view sep)
{
    std::string joined;
    for (const auto &token : tokens)
    {
        if (!joined.empty())
            joined += sep;
        joined += token;
    }
    return joined;
}

} // namespace

bool isCompileCommand(std::string_view command)
{
    return std::find(kCompileCommands.begin(), kCompileCommands.end(), command) !=
           kCompileCommands.end();
}

void applyCompileOverrides(ParsedArgs &args, const SessionMarkers &markers)
{
    if (markers.reload)
        args.compile = false;

    if (isCompileCommand(args.command))
        args.compile = true;

    if (markers.compileRequested)
        args.compile = true;
}

/// @brief Parse @p tokens against @p grammar.
///
/// @details Step-by-step summary:
///          1. Scan tokens left to right.  Declared options are applied as
///             they are met, and a long option may be shortened to any
///             unambiguous prefix.  Undeclared option-looking tokens are set
///             aside as unrecognised; everything else queues as a positional.
///          2. Help and version requests return immediately, so they win over
///             missing positionals but not over an earlier malformed option.
///          3. Fill positionals in declaration order, applying defaults for
///             omitted optional ones and reporting omitted required ones.
///          4. Surplus positionals join the unrecognised list; a strict
///             grammar turns a non-empty list into an error.
///          5. Apply the compile overrides.
support::Expected<ParseResult> parseArguments(const Grammar &grammar,
                                              const std::vector<std::string> &tokens,
                                              const SessionMarkers &markers)
{
    ParseResult result;
    std::vector<IndexedToken> positionals;
    std::vector<IndexedToken> unknown;
    bool optionsEnded = false;

    for (std::size_t i = 0; i < tokens.size(); ++i)
    {
        const std::string &token = tokens[i];
        if (optionsEnded)
        {
            positionals.push_back({i, token});
            continue;
        }
        if (token == "--")
        {
            optionsEnded = true;
            continue;
        }
        if (!looksLikeOption(token))
        {
            positionals.push_back({i, token});
            continue;
        }

        std::string_view name = token;
        std::optional<std::string> inlineValue;
        if (const auto eq = token.find('='); eq != std::string::npos)
        {
            name = std::string_view(token).substr(0, eq);
            inlineValue = token.substr(eq + 1);
        }

        const OptionSpec *spec = grammar.findOption(name);
        if (spec == nullptr)
        {
            const std::vector<std::string> matches = grammar.longSpellingsStartingWith(name);
            if (matches.size() > 1)
            {
                return makeError("ambiguous option: " + std::string(name) + " could match " +
                                 joinTokens(matches, ", "));
            }
            if (matches.size() == 1)
                spec = grammar.findOption(matches.front());
        }
        if (spec == nullptr)
        {
            unknown.push_back({i, token});
            continue;
        }

        switch (spec->kind)
        {
            case OptionKind::Help:
            case OptionKind::Version:
            case OptionKind::Flag:
                if (inlineValue)
                {
                    return optionError(*spec, "ignored explicit argument '" + *inlineValue + "'");
                }
                if (spec->kind == OptionKind::Help)
                {
                    result.action = ParseAction::ShowHelp;
                    return result;
                }
                if (spec->kind == OptionKind::Version)
                {
                    result.action = ParseAction::ShowVersion;
                    return result;
                }
                result.args.assign(spec->dest, true);
                break;

            case OptionKind::Value:
            case OptionKind::IntValue:
            {
                std::string text;
                if (inlineValue)
                {
                    text = *inlineValue;
                }
                else if (i + 1 < tokens.size() && !looksLikeOption(tokens[i + 1]))
                {
                    text = tokens[++i];
                }
                else
                {
                    return optionError(*spec, "expected one argument");
                }

                if (spec->kind == OptionKind::Value)
                {
                    result.args.assign(spec->dest, std::move(text));
                    break;
                }

                std::int64_t parsed = 0;
                const char *const begin = text.data();
                const char *const end = begin + text.size();
                const auto fc = std::from_chars(begin, end, parsed);
                if (text.empty() || fc.ec != std::errc() || fc.ptr != end)
                {
                    return optionError(*spec, "invalid int value: '" + text + "'");
                }
                result.args.assign(spec->dest, parsed);
                break;
            }
        }
    }

    std::vector<std::string> missing;
    std::size_t next = 0;
    for (const auto &positional : grammar.positionals())
    {
        if (next < positionals.size())
        {
            result.args.assign(positional.name, positionals[next].text);
            ++next;
        }
        else if (positional.required)
        {
            missing.push_back(positional.name);
        }
        else if (positional.defaultValue)
        {
            result.args.assign(positional.name, *positional.defaultValue);
        }
    }
    if (!missing.empty())
    {
        return makeError("the following arguments are required: " + joinTokens(missing, ", "));
    }

    for (; next < positionals.size(); ++next)
    {
        unknown.push_back(std::move(positionals[next]));
    }
    std::stable_sort(unknown.begin(), unknown.end(), [](const IndexedToken &a, const IndexedToken &b) {
        return a.index < b.index;
    });
    for (auto &token : unknown)
    {
        result.unrecognized.push_back(std::move(token.text));
    }

    if (grammar.isStrict() && !result.unrecognized.empty())
    {
        return makeError("unrecognized arguments: " + joinTokens(result.unrecognized, " "));
    }

    applyCompileOverrides(result.args, markers);
    return result;
}

} // namespace novella::cli
