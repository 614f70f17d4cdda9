//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/UsageFormatter.hpp
// Purpose: Renders usage lines and help text for a Grammar.
// Key invariants: Hidden options never appear in rendered text.
// Ownership/Lifetime: Returns owned strings.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cli/Grammar.hpp"

#include <string>
#include <string_view>

namespace novella::cli
{

/// @brief Program label shown in usage text: the basename of @p argv0.
/// @details Falls back to "novella" when @p argv0 is empty.
[[nodiscard]] std::string programLabel(std::string_view argv0);

/// @brief Render the `usage: prog ...` synopsis, wrapped at 80 columns.
[[nodiscard]] std::string formatUsage(const Grammar &grammar, std::string_view prog);

/// @brief Render the full help text: synopsis, description, positionals,
///        main options, then each option group.
[[nodiscard]] std::string formatHelp(const Grammar &grammar, std::string_view prog);

} // namespace novella::cli
