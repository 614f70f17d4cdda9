//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the environment abstraction.  The process-backed variant wraps
// getenv/setenv (or _putenv_s on Windows); the map-backed variant keeps a
// private table so callers can observe assignments without touching the
// real environment.
//
//===----------------------------------------------------------------------===//

#include "environment.hpp"

#include <cstdlib>
#include <utility>

namespace novella::support
{

/// @brief Assign a variable unless the operator already chose a value.
/// @details An empty but present variable counts as set.
bool Environment::setDefault(const std::string &name, const std::string &value)
{
    if (get(name).has_value())
        return false;
    set(name, value);
    return true;
}

std::optional<std::string> ProcessEnvironment::get(const std::string &name) const
{
    const char *existing = std::getenv(name.c_str());
    if (existing == nullptr)
    {
        return std::nullopt;
    }
    return std::string(existing);
}

void ProcessEnvironment::set(const std::string &name, const std::string &value)
{
#ifdef _WIN32
    _putenv_s(name.c_str(), value.c_str());
#else
    setenv(name.c_str(), value.c_str(), 1);
#endif
}

MapEnvironment::MapEnvironment(std::map<std::string, std::string> initial)
    : vars_(std::move(initial))
{
}

std::optional<std::string> MapEnvironment::get(const std::string &name) const
{
    auto it = vars_.find(name);
    if (it == vars_.end())
        return std::nullopt;
    return it->second;
}

void MapEnvironment::set(const std::string &name, const std::string &value)
{
    vars_[name] = value;
}

} // namespace novella::support
