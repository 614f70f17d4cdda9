//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements launcher argument sanitization.  Store front-ends and the macOS
// loader append tokens such as `-epicapp=...` or `-psn_0_1234` that the
// argument grammar cannot express.  Rather than teaching the grammar about
// them, the sanitizer resets the command line to just the program name, which
// selects the default `run` command.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Detects and removes foreign launcher arguments before parsing.

#include "cli/LauncherSanitizer.hpp"

#include <algorithm>
#include <cctype>

namespace novella::cli
{
namespace
{

std::string toLowerCopy(std::string_view text)
{
    std::string lowered(text.begin(), text.end());
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

} // namespace

bool hasMarker(const std::vector<std::string> &tokens, std::string_view marker)
{
    for (std::size_t i = 1; i < tokens.size(); ++i)
    {
        if (toLowerCopy(tokens[i]).starts_with(marker))
        {
            return true;
        }
    }
    return false;
}

/// @brief Strip foreign arguments, launcher marker first.
///
/// @details Scans a snapshot of the tokens so the decision never depends on
///          partial edits.  Step-by-step summary:
///          1. If any token carries the launcher marker, preserve the tail in
///             the side channel and truncate.
///          2. Otherwise, if any token carries the quarantine marker, truncate
///             and drop the tail.
///          3. Otherwise leave the vector untouched.
SanitizeAction sanitizeLauncherArguments(ArgVector &args)
{
    const std::vector<std::string> snapshot = args.tokens();

    if (hasMarker(snapshot, kEpicLauncherMarker))
    {
        args.preserveLauncherArguments(args.tail());
        args.truncateToProgram();
        return SanitizeAction::LauncherArgsPreserved;
    }

    if (hasMarker(snapshot, kQuarantineMarker))
    {
        args.truncateToProgram();
        return SanitizeAction::QuarantineArgsDropped;
    }

    return SanitizeAction::None;
}

const char *describeSanitizeAction(SanitizeAction action)
{
    switch (action)
    {
        case SanitizeAction::None:
            return "argument vector left untouched";
        case SanitizeAction::LauncherArgsPreserved:
            return "store launcher arguments set aside";
        case SanitizeAction::QuarantineArgsDropped:
            return "quarantine process serial number dropped";
    }
    return "";
}

} // namespace novella::cli
