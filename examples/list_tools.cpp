// Connects to a stdio tool server and prints what it offers.
//
// Usage:
//   list_tools <command> [args...]
//   list_tools --config server.json

#include <iostream>
#include <toolbridge/toolbridge.hpp>

int main(int argc, char* argv[])
{
    if (argc < 2)
    {
        std::cerr << "usage: " << argv[0] << " <command> [args...] | --config <file>\n";
        return 2;
    }

    std::cout << "toolbridge version: " << toolbridge::version_string() << "\n\n";

    try
    {
        toolbridge::ClientOptions options;
        if (std::string(argv[1]) == "--config" && argc > 2)
        {
            options = toolbridge::load_client_options(argv[2]);
        }
        else
        {
            options.command = argv[1];
            options.args.assign(argv + 2, argv + argc);
        }
        toolbridge::apply_environment_overrides(options);

        options.stderr_callback = [](const std::string& line)
        { std::cerr << "[server] " << line << "\n"; };

        toolbridge::ProtocolClient client(options);
        client.connect();

        if (auto info = client.server_info(); info && info->contains("serverInfo"))
            std::cout << "Connected to " << (*info)["serverInfo"].dump() << "\n\n";

        toolbridge::tools::ToolHandler handler(client);
        if (!handler.discover_and_build_tools())
        {
            std::cerr << "Tool discovery failed\n";
            return 1;
        }

        auto descriptions = handler.tool_descriptions();
        if (descriptions.empty())
            std::cout << "(server offers no tools)\n";
        for (const auto& block : descriptions)
            std::cout << block << "\n";
    }
    catch (const toolbridge::ProcessSpawnError& e)
    {
        std::cerr << "Error: could not start server - " << e.what() << "\n";
        return 1;
    }
    catch (const toolbridge::ToolbridgeError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
