#pragma once
#include <string_view>
#include <casket/log/log_manager.hpp>
#include <casket/utils/string.hpp>

namespace certkit::cmd
{

static inline casket::Level ParseLogLevel(std::string_view str)
{
    if (casket::iequals(str, "alert"))
    {
        return casket::Level::Alert;
    }
    else if (casket::iequals(str, "crit"))
    {
        return casket::Level::Critical;
    }
    else if (casket::iequals(str, "error"))
    {
        return casket::Level::Error;
    }
    else if (casket::iequals(str, "warn"))
    {
        return casket::Level::Warning;
    }
    else if (casket::iequals(str, "notice"))
    {
        return casket::Level::Notice;
    }
    else if (casket::iequals(str, "info"))
    {
        return casket::Level::Info;
    }
    else if (casket::iequals(str, "debug"))
    {
        return casket::Level::Debug;
    }

    return casket::Level::Emergency;
}

/// @brief Enables console logging with the level given by --log-level.
static inline void SetupLogging(std::string_view level)
{
    casket::LogManager::Instance().enable(casket::Type::Console);
    casket::LogManager::Instance().setLevel(ParseLogLevel(level));
}

} // namespace certkit::cmd
