//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/ArgumentParser.hpp
// Purpose: Generic parse of a token list against an immutable Grammar.
// Key invariants: Lenient grammars never fail on unknown tokens; strict grammars
//                 always do.  Compile overrides run after every successful parse.
// Ownership/Lifetime: Results are returned by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cli/Grammar.hpp"
#include "cli/LaunchContext.hpp"
#include "cli/ParsedArgs.hpp"
#include "support/diag_expected.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace novella::cli
{

/// @brief Commands that always require a fresh script compile.
inline constexpr std::array<std::string_view, 3> kCompileCommands{"compile",
                                                                  "add_from",
                                                                  "merge_strings"};

/// @brief What the caller must do with a successful parse.
enum class ParseAction
{
    Proceed,    ///< Use the parsed arguments.
    ShowHelp,   ///< -h/--help was given; print help and exit 0.
    ShowVersion ///< --version was given; print the version and exit 0.
};

/// @brief Outcome of @ref parseArguments.
struct ParseResult
{
    ParsedArgs args;

    /// @brief Tokens the grammar did not recognise, in command-line order.
    std::vector<std::string> unrecognized;

    ParseAction action = ParseAction::Proceed;
};

/// @brief Report whether @p command forces compilation.
[[nodiscard]] bool isCompileCommand(std::string_view command);

/// @brief Apply the compile overrides in their fixed order.
/// @details 1. a reload in progress clears compile; 2. a compile-forcing
///          command sets it; 3. a session compile request sets it.  Later
///          steps win over earlier ones.
void applyCompileOverrides(ParsedArgs &args, const SessionMarkers &markers);

/// @brief Parse @p tokens (program name excluded) against @p grammar.
/// @details Accepts `--opt value`, `--opt=value`, unique prefixes of long
///          options, `--` to end option processing, and negative numbers as
///          values.  Positionals are
///          filled in declaration order; surplus positionals join the
///          unrecognised list.  Help and version requests stop the scan.
/// @return The parse result, or an error diagnostic carrying the usage error
///         text (for example "unrecognized arguments: --bogus", or
///         "ambiguous option: --s could match ..." for a shared prefix).
support::Expected<ParseResult> parseArguments(const Grammar &grammar,
                                              const std::vector<std::string> &tokens,
                                              const SessionMarkers &markers);

} // namespace novella::cli
