#pragma once
#include <map>
#include <memory>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <certkit/cli/command.hpp>
#include <casket/utils/singleton.hpp>

namespace certkit::cmd
{

class CommandDispatcher final : public casket::Singleton<CommandDispatcher>
{
public:
    using CommandPtr = std::unique_ptr<Command>;
    using CommandCreator = std::function<CommandPtr()>;

private:
    struct Entry
    {
        std::string description;
        CommandCreator creator;
    };

    using CommandMap = std::map<std::string, Entry, std::less<>>;

public:
    CommandDispatcher() = default;
    ~CommandDispatcher() = default;

    bool hasCommand(std::string_view name) const;

    CommandPtr createCommand(std::string_view name) const;

    /// @brief Prints usage line and registered commands sorted by name.
    void printUsage(std::ostream& os, std::string_view program) const;

    void add(const std::string& name, const std::string& description, CommandCreator creator);

public:
    class Registrar final
    {
    public:
        Registrar(const std::string& name, const std::string& description, CommandCreator creator)
        {
            CommandDispatcher::Instance().add(name, description, std::move(creator));
        }
    };

private:
    CommandMap commands_;
};

#define REGISTER_COMMAND(commandName, commandDesc, className)                                                          \
    const certkit::cmd::CommandDispatcher::Registrar className##Registrar(                                             \
        commandName, commandDesc, []() -> certkit::cmd::CommandDispatcher::CommandPtr {                                \
            return std::make_unique<className>();                                                                      \
        })

} // namespace certkit::cmd
