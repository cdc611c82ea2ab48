#include "core/config.hpp"
#include "core/errors.hpp"
#include "commands/commands.hpp"
#include "system/system.hpp"
#include "cli/cli.hpp"
#include <iostream>
#include <vector>
#include <string>
#include <map>

using namespace aka;

int main(int argc, char** argv) {
    core::Config cfg;

    try {
        cfg = core::loadConfig();
        cfg.executable = system::executablePath(argc > 0 ? argv[0] : "aka");

        // Parse global flags - first expand short flags
        std::vector<std::string> rawArgs;
        rawArgs.reserve(argc > 0 ? argc - 1 : 0);
        for (int i = 1; i < argc; ++i) {
            rawArgs.push_back(argv[i]);
        }

        std::vector<std::string> expandedArgs = cli::expandShortFlags(rawArgs);

        // Process global flags
        std::vector<std::string> args;
        args.reserve(expandedArgs.size());
        bool passthrough = false;
        for (const auto& arg : expandedArgs) {
            if (arg == "--") {
                passthrough = true;
            }
            if (!passthrough && arg == "--json") {
                cfg.json = true;
            } else {
                args.push_back(arg);
            }
        }

        // Bare `aka` lists the aliases active here
        if (args.empty()) {
            return commands::cmd_list(cfg, {"list"});
        }

        // Command dispatch table
        std::map<std::string, commands::CommandHandler> commandMap = {
            {"help", commands::cmd_help},
            {"--help", commands::cmd_help},
            {"welcome", commands::cmd_welcome},
            {"version", commands::cmd_version},
            {"--version", commands::cmd_version},

            // Alias management
            {"add", commands::cmd_add},
            {"remove", commands::cmd_remove},
            {"rm", commands::cmd_remove},
            {"list", commands::cmd_list},
            {"ls", commands::cmd_list},

            // Shell integration
            {"init", commands::cmd_init},
            {"install", commands::cmd_install},
            {"completion", commands::cmd_completion}
        };

        auto it = commandMap.find(args[0]);
        if (it != commandMap.end()) {
            return it->second(cfg, args);
        }
        return commands::cmd_implicit(cfg, args);
    } catch (const core::AkaError& e) {
        core::error(cfg, e.what());
    } catch (const std::exception& e) {
        core::error(cfg, std::string("Unexpected error: ") + e.what());
    }
    return 1;
}
