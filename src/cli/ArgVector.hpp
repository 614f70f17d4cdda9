//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/ArgVector.hpp
// Purpose: Owning copy of the process argument vector shared by every parse pass.
// Key invariants: Element zero is the program name whenever the vector is non-empty.
// Ownership/Lifetime: Copies argv at construction; the launcher owns the instance
//                     for the lifetime of the process.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace novella::cli
{

/// @brief Process argument vector that the sanitizer may truncate in place.
/// @details Unlike a borrowed argv view this type owns its tokens so that
///          sanitization can drop foreign arguments without touching the C
///          runtime's storage.  Tokens removed because a third-party launcher
///          injected them are kept in a side channel for privileged commands.
class ArgVector
{
  public:
    ArgVector() = default;

    /// @brief Adopt @p tokens, where element zero is the program name.
    explicit ArgVector(std::vector<std::string> tokens);

    /// @brief Copy the argument vector handed to `main`.
    static ArgVector fromMain(int argc, char **argv);

    [[nodiscard]] bool empty() const
    {
        return tokens_.empty();
    }

    [[nodiscard]] std::size_t size() const
    {
        return tokens_.size();
    }

    /// @brief Program name, or an empty string when the vector is empty.
    [[nodiscard]] const std::string &programName() const;

    /// @brief All tokens including the program name.
    [[nodiscard]] const std::vector<std::string> &tokens() const
    {
        return tokens_;
    }

    /// @brief Copy of the tokens following the program name.
    [[nodiscard]] std::vector<std::string> tail() const;

    /// @brief Drop every token after the program name.
    void truncateToProgram();

    /// @brief Record @p args as the launcher-supplied tail removed by sanitization.
    void preserveLauncherArguments(std::vector<std::string> args);

    /// @brief Launcher-supplied tokens removed by sanitization, if any.
    [[nodiscard]] const std::optional<std::vector<std::string>> &launcherArguments() const
    {
        return launcherArgs_;
    }

  private:
    std::vector<std::string> tokens_;
    std::optional<std::vector<std::string>> launcherArgs_;
};

} // namespace novella::cli
