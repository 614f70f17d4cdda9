//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/BuiltinCommands.hpp
// Purpose: Declarations for the launcher's built-in command handlers.
// Key invariants: Only `run` needs a display and only `run` continues startup.
// Ownership/Lifetime: N/A.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cli/CommandContext.hpp"
#include "cli/CommandRegistry.hpp"

namespace novella::cli
{

/// @brief Handle `run`, the default command.
///
/// Declares `--profile-display` and `--debug-image-cache`, applies the warp
/// target once per session, and forwards the debug switches to the engine.
///
/// @return Always true: normal startup continues.
bool cmdRun(CommandContext &ctx);

/// @brief Handle `lint`.
///
/// Accepts an optional report `filename` and `--error-code`.  With
/// `--error-code`, any reported problem sets the exit status to 1.
///
/// @return Always false: the process stops after linting.
bool cmdLint(CommandContext &ctx);

/// @brief Handle `compile`; the compile flag is already forced by the parser.
/// @return Always false.
bool cmdCompile(CommandContext &ctx);

/// @brief Handle `rmpersistent`: delete persistent data and stop it being saved.
/// @return Always false; a failed deletion sets the exit status to 1.
bool cmdRmPersistent(CommandContext &ctx);

/// @brief Handle `quit`: validate arguments and stop.
/// @return Always false.
bool cmdQuit(CommandContext &ctx);

/// @brief Register every built-in command with @p registry.
void registerBuiltinCommands(CommandRegistry &registry);

} // namespace novella::cli
