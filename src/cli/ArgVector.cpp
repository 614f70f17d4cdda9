//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "cli/ArgVector.hpp"

#include <utility>

namespace novella::cli
{

ArgVector::ArgVector(std::vector<std::string> tokens) : tokens_(std::move(tokens)) {}

/// @brief Copy the C runtime argument vector.
/// @details Null entries terminate the copy early; a null @p argv yields an
///          empty vector.
ArgVector ArgVector::fromMain(int argc, char **argv)
{
    std::vector<std::string> tokens;
    if (argv == nullptr)
    {
        return ArgVector(std::move(tokens));
    }
    tokens.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0);
    for (int i = 0; i < argc && argv[i] != nullptr; ++i)
    {
        tokens.emplace_back(argv[i]);
    }
    return ArgVector(std::move(tokens));
}

const std::string &ArgVector::programName() const
{
    static const std::string kEmpty;
    return tokens_.empty() ? kEmpty : tokens_.front();
}

std::vector<std::string> ArgVector::tail() const
{
    if (tokens_.size() <= 1)
    {
        return {};
    }
    return std::vector<std::string>(tokens_.begin() + 1, tokens_.end());
}

void ArgVector::truncateToProgram()
{
    if (tokens_.size() > 1)
    {
        tokens_.resize(1);
    }
}

void ArgVector::preserveLauncherArguments(std::vector<std::string> args)
{
    launcherArgs_ = std::move(args);
}

} // namespace novella::cli
