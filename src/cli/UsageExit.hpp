//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/UsageExit.hpp
// Purpose: Terminal paths of a parse: usage errors, help, and version output.
// Key invariants: Usage errors always exit with kUsageErrorExitCode; help and
//                 version always exit with 0.
// Ownership/Lifetime: N/A.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cli/ArgumentParser.hpp"
#include "cli/Grammar.hpp"
#include "support/diag_expected.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace novella::cli
{

/// @brief Exit status for command-line usage errors.
inline constexpr int kUsageErrorExitCode = 2;

/// @brief Write the synopsis followed by `prog: error: message` to @p os.
void printUsageError(std::ostream &os,
                     const Grammar &grammar,
                     std::string_view prog,
                     const support::Diag &diag);

/// @brief Print a usage error to stderr and terminate the process.
[[noreturn]] void exitWithUsageError(const Grammar &grammar,
                                     std::string_view prog,
                                     const support::Diag &diag);

/// @brief Parse @p tokens and resolve every terminal outcome.
/// @details Errors exit through @ref exitWithUsageError; help and version
///          requests print to stdout and exit 0.  Only a parse that should
///          proceed returns.
ParseResult parseOrExit(const Grammar &grammar,
                        const std::vector<std::string> &tokens,
                        const SessionMarkers &markers,
                        std::string_view prog);

} // namespace novella::cli
