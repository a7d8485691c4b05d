// Invokes one tool on a stdio server with either JSON arguments or free text.
//
// Usage:
//   invoke_tool <tool> '<input>' <command> [args...]
//
// Examples:
//   invoke_tool get_weather 'weather in Austin' node weather-server.js
//   invoke_tool to_fahrenheit '{"celsius": 25}' node weather-server.js

#include <iostream>
#include <toolbridge/toolbridge.hpp>

int main(int argc, char* argv[])
{
    if (argc < 4)
    {
        std::cerr << "usage: " << argv[0] << " <tool> <input> <command> [args...]\n";
        return 2;
    }

    toolbridge::ClientOptions options;
    options.command = argv[3];
    options.args.assign(argv + 4, argv + argc);
    options.log_level = toolbridge::LogLevel::Info;
    options.log_callback = [](toolbridge::LogLevel level, const std::string& message)
    { std::cerr << "[" << toolbridge::to_string(level) << "] " << message << "\n"; };
    toolbridge::apply_environment_overrides(options);

    try
    {
        toolbridge::ProtocolClient client(options);
        client.connect();

        toolbridge::tools::ToolHandler handler(client);
        if (!handler.discover_and_build_tools())
            return 1;

        // invoke() reports every failure as text
        std::cout << handler.invoke(argv[1], argv[2]) << "\n";
        client.close();
    }
    catch (const toolbridge::ToolbridgeError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
