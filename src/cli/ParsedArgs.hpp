//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/ParsedArgs.hpp
// Purpose: Record of global flag values plus command-specific values from one parse pass.
// Key invariants: A later pass replaces an earlier record wholesale; nothing is merged.
// Ownership/Lifetime: Value type.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace novella::cli
{

/// @brief Value stored for a command-specific option or positional.
using OptionValue = std::variant<bool, std::int64_t, std::string>;

/// @brief Arguments produced by one parse pass.
struct ParsedArgs
{
    /// @brief Project root; empty selects the executable's directory.
    std::string basedir;

    /// @brief Command selecting the handler.
    std::string command = "run";

    /// @brief Directory for saves and persistent data.
    std::optional<std::string> savedir;

    /// @brief Trace verbosity (1 = per-call, 2 = per-line).
    std::int64_t trace = 0;

    bool compile = false;
    bool compilePython = false;
    bool keepOrphanRpyc = false;
    bool lint = false;
    bool errorsInEditor = false;
    bool safeMode = false;

    /// @brief `file:line` to warp to.
    std::optional<std::string> warp;

    /// @brief JSON dump destination.
    std::optional<std::string> jsonDump;
    bool jsonDumpPrivate = false;
    bool jsonDumpCommon = false;

    /// @brief Command-specific values keyed by destination name.
    std::map<std::string, OptionValue, std::less<>> extras;

    /// @brief Read a command-specific boolean; missing or non-boolean yields false.
    [[nodiscard]] bool flag(std::string_view dest) const;

    /// @brief Read a command-specific string; missing or non-string yields nullopt.
    [[nodiscard]] std::optional<std::string> text(std::string_view dest) const;

    /// @brief Store @p value under @p dest, routing global destinations to
    ///        their named fields.
    void assign(std::string_view dest, OptionValue value);
};

} // namespace novella::cli
