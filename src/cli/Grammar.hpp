//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/Grammar.hpp
// Purpose: Immutable description of the launcher's command-line grammar.
// Key invariants: Global options are declared identically in lenient and strict
//                 grammars; only strict grammars carry -h/--help and reject
//                 unknown tokens.
// Ownership/Lifetime: Value type; builders return fresh instances.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace novella::cli
{

/// @brief How an option consumes tokens and what it stores.
enum class OptionKind
{
    Flag,     ///< Stores true when present.
    Value,    ///< Consumes one token and stores it as a string.
    IntValue, ///< Consumes one token and stores it as an integer.
    Version,  ///< Requests the version banner.
    Help      ///< Requests the help text.
};

/// @brief Declaration of a single option such as `--savedir DIRECTORY`.
struct OptionSpec
{
    /// @brief Spellings, e.g. {"-h", "--help"}.
    std::vector<std::string> names;

    /// @brief Destination key in ParsedArgs.
    std::string dest;

    OptionKind kind = OptionKind::Flag;

    /// @brief Placeholder shown in usage for value options.
    std::string metavar;

    std::string help;

    /// @brief Omit from usage and help output.
    bool hidden = false;

    /// @brief Index into Grammar::groups(), or nullopt for the main section.
    std::optional<std::size_t> group;
};

/// @brief Declaration of a positional argument.
struct PositionalSpec
{
    std::string name;
    std::string help;

    /// @brief When false the positional may be omitted and takes @ref defaultValue.
    bool required = true;

    /// @brief Value used when an optional positional is omitted; nullopt stores nothing.
    std::optional<std::string> defaultValue;
};

/// @brief Titled section of related options in help output.
struct OptionGroup
{
    std::string title;
    std::string description;
};

/// @brief Whether unknown tokens are tolerated.
enum class GrammarMode
{
    Lenient, ///< Unknown tokens are returned to the caller.
    Strict   ///< Unknown tokens are a usage error.
};

/// @brief Extra declarations a command contributes to its strict grammar.
struct CommandScope
{
    /// @brief Command the grammar is scoped to; names the help group.
    std::string command;

    /// @brief Description printed under the command's help group.
    std::string description;

    /// @brief When false, basedir and command may be omitted even in strict mode.
    bool requireCommand = true;

    /// @brief Command-specific options; their group is assigned by the builder.
    std::vector<OptionSpec> options;

    /// @brief Command-specific positionals following basedir and command.
    std::vector<PositionalSpec> positionals;
};

/// @brief Immutable grammar consumed by @ref parseArguments.
class Grammar
{
  public:
    Grammar(GrammarMode mode,
            std::string description,
            std::vector<PositionalSpec> positionals,
            std::vector<OptionSpec> options,
            std::vector<OptionGroup> groups);

    [[nodiscard]] GrammarMode mode() const
    {
        return mode_;
    }

    [[nodiscard]] bool isStrict() const
    {
        return mode_ == GrammarMode::Strict;
    }

    [[nodiscard]] const std::string &description() const
    {
        return description_;
    }

    [[nodiscard]] const std::vector<PositionalSpec> &positionals() const
    {
        return positionals_;
    }

    [[nodiscard]] const std::vector<OptionSpec> &options() const
    {
        return options_;
    }

    [[nodiscard]] const std::vector<OptionGroup> &groups() const
    {
        return groups_;
    }

    /// @brief Find the option spelled exactly @p name.
    /// @return Pointer into this grammar, or nullptr when undeclared.
    [[nodiscard]] const OptionSpec *findOption(std::string_view name) const;

    /// @brief Long (`--`) spellings that begin with @p prefix, in declaration order.
    /// @details Used to expand abbreviations such as `--safe` for `--safe-mode`.
    [[nodiscard]] std::vector<std::string> longSpellingsStartingWith(std::string_view prefix) const;

  private:
    GrammarMode mode_;
    std::string description_;
    std::vector<PositionalSpec> positionals_;
    std::vector<OptionSpec> options_;
    std::vector<OptionGroup> groups_;
};

/// @brief Build the bootstrap grammar.
/// @details basedir and command are optional (defaults "" and "run"), no help
///          flag is declared, and unknown tokens are tolerated.
/// @param commandNames Sorted command names listed in the command's help text.
Grammar buildLenientGrammar(const std::vector<std::string> &commandNames = {});

/// @brief Build a strict grammar scoped to @p scope.
/// @details Declares -h/--help, makes basedir and command required unless the
///          scope opts out, and appends the scope's own options under a
///          "<command> command arguments" group.
/// @param scope Command-specific declarations.
/// @param commandNames Sorted command names listed in the command's help text.
Grammar buildStrictGrammar(const CommandScope &scope, const std::vector<std::string> &commandNames);

} // namespace novella::cli
