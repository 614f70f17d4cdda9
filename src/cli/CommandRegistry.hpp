//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/CommandRegistry.hpp
// Purpose: Maps command names to handlers and their display requirement.
// Key invariants: Names are unique; the last registration of a name wins.
//                 No registration is accepted once the registry is sealed.
// Ownership/Lifetime: The registry owns its entries for the process lifetime.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace novella::cli
{

class CommandContext;

/// @brief Command implementation.
/// @return True to continue normal startup, false to stop the process.
using CommandHandler = std::function<bool(CommandContext &)>;

/// @brief A registered command.
struct CommandEntry
{
    std::string name;
    CommandHandler handler;

    /// @brief When false, headless audio/video drivers are selected.
    bool needsDisplay = false;
};

/// @brief Registry consulted by the dispatcher.
class CommandRegistry
{
  public:
    /// @brief Register @p handler under @p name, replacing any earlier entry.
    void registerCommand(std::string name, CommandHandler handler, bool needsDisplay = false);

    /// @brief Find the entry registered under @p name.
    /// @return Pointer owned by the registry, or nullptr when unknown.
    [[nodiscard]] const CommandEntry *lookup(std::string_view name) const;

    /// @brief Registered names in sorted order.
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::size_t size() const
    {
        return entries_.size();
    }

    /// @brief Mark registration as complete.
    void seal()
    {
        sealed_ = true;
    }

    [[nodiscard]] bool sealed() const
    {
        return sealed_;
    }

  private:
    std::map<std::string, CommandEntry, std::less<>> entries_;
    bool sealed_ = false;
};

} // namespace novella::cli
