//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the session store shared by successive launches inside one
// process.  The launcher reads its reload/compile/warp markers from here at
// bootstrap and writes them back once dispatch has run.
//
//===----------------------------------------------------------------------===//

#include "session_store.hpp"

#include <utility>

namespace novella::support
{

void SessionStore::set(std::string key, Value value)
{
    values_.insert_or_assign(std::move(key), std::move(value));
}

bool SessionStore::getFlag(std::string_view key, bool fallback) const
{
    auto it = values_.find(key);
    if (it == values_.end())
        return fallback;
    if (const bool *flag = std::get_if<bool>(&it->second))
        return *flag;
    return !std::get<std::string>(it->second).empty();
}

} // namespace novella::support
