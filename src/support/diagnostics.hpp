//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic record and the engine collecting launch notes
//          and lint problems.
// Key invariants: errorCount() equals the number of error-severity reports.
// Ownership/Lifetime: Engine owns collected diagnostics.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace novella::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Error
};

/// @brief Single diagnostic message.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Record a note-severity diagnostic carrying @p message.
    void note(std::string message);

    /// @brief Print all recorded diagnostics to stream @p os.
    void printAll(std::ostream &os) const;

    /// @brief Access the recorded diagnostics in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief Number of errors reported.
    size_t errorCount() const;

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
};

} // namespace novella::support
