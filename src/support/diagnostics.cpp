//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic engine that accumulates launch notes.  The
// launcher records what it did to the argument vector and which command it
// resolved; the tool prints the collected notes when tracing is requested.
// The console lint check collects its problems in an engine of its own and
// reports the error count as its result.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the diagnostic engine responsible for collecting messages.

#include "diagnostics.hpp"
#include "diag_expected.hpp"

#include <utility>

namespace novella::support
{

/// @brief Adds a diagnostic to the engine, counting it when it is an error.
/// @param d Diagnostic to record; moved into the engine's storage.
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::note(std::string message)
{
    report(makeNote(std::move(message)));
}

/// @brief Writes all stored diagnostics to the provided output stream.
/// @param os Output stream that receives the formatted diagnostics.
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

} // namespace novella::support
