//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/novella/console_services.hpp
// Purpose: Engine services for the standalone launcher binary.
// Key invariants: Never throws; filesystem failures are reported on the error stream.
//                 An empty basedir means the project default given at construction.
// Ownership/Lifetime: Borrows the output streams passed at construction.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cli/EngineServices.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace novella::tools
{

/// @brief Startup settings collected from the commands.
struct StartupSettings
{
    std::optional<std::string> warpSpec;
    bool profileDisplay = false;
    bool debugImageCache = false;
    bool savePersistent = true;
};

/// @brief EngineServices backed by the local filesystem and console streams.
class ConsoleEngineServices final : public cli::EngineServices
{
  public:
    /// @param projectDefault Project directory used when basedir is empty;
    ///        the `novella` binary passes its own directory.
    ConsoleEngineServices(std::ostream &out,
                          std::ostream &err,
                          std::filesystem::path projectDefault);

    void setWarpSpec(const std::string &spec) override;
    void setProfileDisplay(bool enabled) override;
    void setDebugImageCache(bool enabled) override;

    /// @brief Check that the project layout is loadable.
    /// @details Reports a problem for a missing project directory, a missing
    ///          `game` directory, or a `game` directory without any `.rpy`
    ///          script.  The report goes to stdout or to the request's file; a
    ///          report file that cannot be opened counts as a problem and the
    ///          report falls back to stdout.
    std::size_t runLint(const cli::LintRequest &request) override;

    /// @brief Remove `<savedir>/persistent`, defaulting savedir to
    ///        `<project>/game/saves`.
    bool unlinkPersistent(const cli::ParsedArgs &args) override;

    void setShouldSavePersistent(bool enabled) override;

    [[nodiscard]] const StartupSettings &settings() const
    {
        return settings_;
    }

  private:
    std::ostream &out_;
    std::ostream &err_;
    std::filesystem::path projectDefault_;
    StartupSettings settings_;
};

/// @brief Directory containing the program invoked as @p programName.
[[nodiscard]] std::filesystem::path executableDirectory(const std::string &programName);

/// @brief Project directory named by @p basedir, or @p projectDefault when empty.
[[nodiscard]] std::filesystem::path projectDirectory(const std::string &basedir,
                                                     const std::filesystem::path &projectDefault);

/// @brief Directory holding saves and persistent data for @p args.
[[nodiscard]] std::filesystem::path saveDirectory(const cli::ParsedArgs &args,
                                                  const std::filesystem::path &projectDefault);

} // namespace novella::tools
