#include <cstdlib>
#include <iostream>
#include <filesystem>
#include <casket/utils/string.hpp>
#include <certkit/cli/command_dispatcher.hpp>

using namespace casket;
using namespace certkit::cmd;

int main(int argc, char* argv[])
{
    const auto program = std::filesystem::path(argv[0]).filename().string();
    auto& dispatcher = CommandDispatcher::Instance();

    if (argc < 2)
    {
        dispatcher.printUsage(std::cerr, program);
        return EXIT_FAILURE;
    }

    std::string_view name(argv[1]);
    if (equals(name, "-h") || equals(name, "--help"))
    {
        dispatcher.printUsage(std::cout, program);
        return EXIT_SUCCESS;
    }
    if (equals(name, "--version"))
    {
        std::cout << program << " " << CERTKIT_VERSION << std::endl;
        return EXIT_SUCCESS;
    }
    if (!dispatcher.hasCommand(name))
    {
        std::cerr << program << ": unknown command '" << name << "'" << std::endl;
        dispatcher.printUsage(std::cerr, program);
        return EXIT_FAILURE;
    }

    try
    {
        auto cmd = dispatcher.createCommand(name);
        cmd->execute(std::vector<std::string_view>(argv + 2, argv + argc));
    }
    catch (const std::system_error& e)
    {
        std::cerr << program << ": " << e.what() << " [" << e.code() << "]" << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << program << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
