//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library.  The utilities here build note and error diagnostics, map
// severities to their printed labels, and print diagnostics in the
// `tool: severity: message` form used by every launcher error path.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Diagnostic constructors and the shared diagnostic printer.

#include "diag_expected.hpp"

namespace novella::support
{

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(std::string msg)
{
    return Diag{Severity::Error, std::move(msg)};
}

Diag makeNote(std::string msg)
{
    return Diag{Severity::Note, std::move(msg)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When @p prefix is non-empty the line starts with `prefix: `,
///          matching the `prog: error: message` convention of command-line
///          usage errors.  A trailing newline is always emitted so multiple
///          diagnostics appear as a contiguous block.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param prefix Tool name, or empty to omit.
void printDiag(const Diag &diag, std::ostream &os, std::string_view prefix)
{
    if (!prefix.empty())
    {
        os << prefix << ": ";
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}

} // namespace novella::support
