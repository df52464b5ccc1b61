#pragma once
#include <vector>
#include <string_view>
#include <casket/utils/noncopyable.hpp>

namespace certkit::cmd
{

/// @brief Subcommand of the certkit tool, e.g. `certkit issue ...`.
class Command : public casket::NonCopyable
{
public:
    Command() = default;

    virtual ~Command() = default;

    /// @param args Arguments following the subcommand name.
    virtual void execute(const std::vector<std::string_view>& args) = 0;
};

} // namespace certkit::cmd
