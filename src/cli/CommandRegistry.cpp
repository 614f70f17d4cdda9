//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "cli/CommandRegistry.hpp"

#include <cassert>
#include <utility>

namespace novella::cli
{

void CommandRegistry::registerCommand(std::string name, CommandHandler handler, bool needsDisplay)
{
    assert(!sealed_ && "command registered after dispatch preparation");
    CommandEntry entry{name, std::move(handler), needsDisplay};
    entries_.insert_or_assign(std::move(name), std::move(entry));
}

const CommandEntry *CommandRegistry::lookup(std::string_view name) const
{
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<std::string> CommandRegistry::names() const
{
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto &item : entries_)
    {
        result.push_back(item.first);
    }
    return result;
}

} // namespace novella::cli
