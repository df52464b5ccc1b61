#include <algorithm>
#include <stdexcept>
#include <certkit/cli/command_dispatcher.hpp>

namespace certkit::cmd
{

bool CommandDispatcher::hasCommand(std::string_view name) const
{
    return commands_.find(name) != commands_.end();
}

CommandDispatcher::CommandPtr CommandDispatcher::createCommand(std::string_view name) const
{
    auto it = commands_.find(name);
    if (it == commands_.end())
    {
        throw std::runtime_error("Unknown command: " + std::string(name));
    }
    return it->second.creator();
}

void CommandDispatcher::printUsage(std::ostream& os, std::string_view program) const
{
    os << "Usage: " << program << " <command> [options]" << std::endl << std::endl;
    os << "Commands:" << std::endl;

    size_t width{0};
    for (const auto& [name, entry] : commands_)
    {
        width = std::max(width, name.size());
    }

    for (const auto& [name, entry] : commands_)
    {
        os << "  " << name << std::string(width - name.size() + 4, ' ') << entry.description << std::endl;
    }

    os << std::endl << "Use '" << program << " <command> --help' for command options." << std::endl;
}

void CommandDispatcher::add(const std::string& name, const std::string& description, CommandCreator creator)
{
    if (!commands_.emplace(name, Entry{description, std::move(creator)}).second)
    {
        throw std::logic_error("Duplicated command: " + name);
    }
}

} // namespace certkit::cmd
