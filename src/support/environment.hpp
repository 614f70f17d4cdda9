//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/environment.hpp
// Purpose: Abstracts the process environment so launch code can be exercised in isolation.
// Key invariants: setDefault never overwrites an existing variable.
// Ownership/Lifetime: ProcessEnvironment mutates the real process environment;
//                     MapEnvironment owns a private copy.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace novella::support
{

/// @brief Read/write access to environment variables.
class Environment
{
  public:
    virtual ~Environment() = default;

    /// @brief Look up variable @p name.
    /// @return Its value, or nullopt when unset.
    [[nodiscard]] virtual std::optional<std::string> get(const std::string &name) const = 0;

    /// @brief Assign @p value to @p name, replacing any existing value.
    virtual void set(const std::string &name, const std::string &value) = 0;

    /// @brief Assign @p value to @p name only when the variable is unset.
    /// @return True when the variable was assigned.
    bool setDefault(const std::string &name, const std::string &value);
};

/// @brief Environment backed by getenv/setenv of the running process.
class ProcessEnvironment final : public Environment
{
  public:
    [[nodiscard]] std::optional<std::string> get(const std::string &name) const override;
    void set(const std::string &name, const std::string &value) override;
};

/// @brief Environment held in memory; used by tests and embedders.
class MapEnvironment final : public Environment
{
  public:
    MapEnvironment() = default;
    explicit MapEnvironment(std::map<std::string, std::string> initial);

    [[nodiscard]] std::optional<std::string> get(const std::string &name) const override;
    void set(const std::string &name, const std::string &value) override;

  private:
    std::map<std::string, std::string> vars_;
};

} // namespace novella::support
