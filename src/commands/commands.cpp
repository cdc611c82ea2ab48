#include "commands/commands.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "storage/codec.hpp"
#include "storage/store.hpp"
#include "shell/generator.hpp"
#include "history/history.hpp"
#include "system/system.hpp"
#include "ui/ui.hpp"
#include "cli/cli.hpp"
#include <iostream>
#include <sstream>
#include <algorithm>
#include <filesystem>

namespace aka {
namespace commands {

namespace {

storage::AliasStore openStore(const core::Config& cfg) {
    system::ensureSecureDir(cfg.dataDir);
    return storage::AliasStore::open(cfg);
}

size_t parseLimit(const std::string& value) {
    bool numeric = !value.empty() &&
                   std::all_of(value.begin(), value.end(),
                               [](unsigned char c) { return c >= '0' && c <= '9'; });
    if (!numeric || value.size() > 9) {
        throw core::UsageError("Invalid value for --limit: '" + value + "'");
    }
    return static_cast<size_t>(std::stoul(value));
}

std::string definitionCount(size_t n) {
    return std::to_string(n) + (n == 1 ? " definition" : " definitions");
}

} // namespace

// Option parsing
Options parseOptions(const std::vector<std::string>& args, size_t first) {
    Options opts;

    for (size_t i = first; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--") {
            opts.positional.insert(opts.positional.end(), args.begin() + i + 1, args.end());
            break;
        }
        if (arg == "--scope") {
            opts.scopeGiven = true;
            // The directory is optional: a following flag is not taken as one
            if (i + 1 < args.size() && !args[i + 1].empty() && args[i + 1][0] != '-') {
                opts.scopeValue = args[++i];
            }
        } else if (arg.rfind("--scope=", 0) == 0) {
            opts.scopeGiven = true;
            opts.scopeValue = arg.substr(8);
        } else if (arg == "--recursive") {
            opts.recursive = true;
        } else if (arg == "--all") {
            opts.all = true;
        } else if (arg == "--force") {
            opts.force = true;
        } else if (arg == "--dump") {
            opts.dump = true;
        } else if (arg == "--limit") {
            if (i + 1 >= args.size()) {
                throw core::UsageError("Missing value for --limit");
            }
            opts.limit = parseLimit(args[++i]);
        } else if (arg.rfind("--limit=", 0) == 0) {
            opts.limit = parseLimit(arg.substr(8));
        } else if (arg.size() > 2 && arg.rfind("--", 0) == 0) {
            throw core::UsageError("Unknown option '" + arg + "'");
        } else {
            opts.positional.push_back(arg);
        }
    }

    return opts;
}

std::optional<storage::Scope> scopeFromOptions(const Options& opts) {
    // --recursive alone scopes to the working directory tree
    if (!opts.scopeGiven && !opts.recursive) {
        return std::nullopt;
    }
    return storage::parseScopeArgument(opts.scopeValue, opts.recursive);
}

bool isValidAliasName(const std::string& name) {
    // The name becomes `name() {` in the dump, so the generator's rule applies
    return shell::isValidFunctionName(name);
}

std::string scopeLabel(const storage::Scope& scope) {
    return scope.isGlobal() ? std::string("global") : scope.path;
}

// Store operations
std::string addAlias(storage::AliasStore& store, const std::string& name,
                     const std::string& command, const storage::Scope& scope) {
    store.add(name, command, scope);
    std::string msg = "Added alias '" + name + "' for '" + command + "'";
    if (!scope.isGlobal()) {
        msg += " (" + scope.describe() + ")";
    }
    return msg;
}

std::string removeAlias(storage::AliasStore& store, const std::string& name,
                        const std::optional<storage::Scope>& scope) {
    if (!scope) {
        auto removed = store.remove(name);
        if (!removed) {
            throw core::AliasNotFound(name);
        }
        return "Removed alias '" + name + "' (" + definitionCount(removed->size()) + ")";
    }

    auto removed = store.removeScope(name, *scope);
    if (!removed) {
        if (store.list().count(name) == 0) {
            throw core::AliasNotFound(name);
        }
        throw core::ScopeNotFound(name, scopeLabel(*scope));
    }
    return "Removed alias '" + name + "' from scope '" + scopeLabel(*scope) + "'";
}

std::string removeAliases(storage::AliasStore& store, const std::optional<storage::Scope>& scope) {
    if (!scope) {
        size_t count = store.removeAll();
        return "Removed " + std::to_string(count) + " alias(es)";
    }
    storage::AliasMap removed = store.removeAllInScope(*scope);
    return "Removed " + std::to_string(removed.size()) + " alias(es) from scope '" +
           scopeLabel(*scope) + "'";
}

// Output formatting
std::string formatAliasList(const storage::AliasMap& aliases) {
    std::ostringstream out;
    for (const auto& [name, definitions] : aliases) {
        for (const auto& def : definitions) {
            out << name << " = '" << def.command << "' (" << def.scope.describe() << ")\n";
        }
    }
    return out.str();
}

std::string formatAliasJson(const storage::AliasMap& aliases) {
    std::ostringstream out;
    out << "[";
    bool first = true;
    for (const auto& [name, definitions] : aliases) {
        for (const auto& def : definitions) {
            if (!first) out << ",";
            first = false;
            out << "{\"name\":" << storage::jsonQuote(name)
                << ",\"command\":" << storage::jsonQuote(def.command);
            switch (def.scope.kind) {
            case storage::Scope::Kind::Global:
                out << ",\"scope\":\"global\"";
                break;
            case storage::Scope::Kind::Exact:
                out << ",\"scope\":\"exact\",\"path\":" << storage::jsonQuote(def.scope.path);
                break;
            case storage::Scope::Kind::Recursive:
                out << ",\"scope\":\"recursive\",\"path\":" << storage::jsonQuote(def.scope.path);
                break;
            }
            out << "}";
        }
    }
    out << "]";
    return out.str();
}

bool confirm(const std::string& prompt, std::istream& in, std::ostream& out) {
    out << prompt;
    out.flush();
    std::string answer;
    if (!std::getline(in, answer)) {
        out << "\n";
        return false;
    }
    answer = core::toLower(core::trim(answer));
    return answer == "y" || answer == "yes";
}

// Command handlers
int cmd_add(const core::Config& cfg, const std::vector<std::string>& args) {
    Options opts = parseOptions(args);
    if (opts.positional.size() > 2) {
        core::error(cfg, "Usage: aka add <name> <command> [--scope [DIR]] [--recursive]");
    }
    if (!opts.positional.empty() && !isValidAliasName(opts.positional[0])) {
        core::error(cfg, "Invalid alias name: '" + opts.positional[0] + "'");
    }

    storage::Scope scope = scopeFromOptions(opts).value_or(storage::Scope::global());

    std::string name;
    std::string command;
    if (opts.positional.size() == 2) {
        name = opts.positional[0];
        command = opts.positional[1];
    } else {
        // No command given: pick one from shell history
        std::string historyPath = history::resolveHistoryPath(cfg);
        auto entries = history::readHistoryEntries(historyPath, opts.limit);
        if (entries.empty()) {
            core::info(cfg, "No history entries found");
            return 0;
        }
        command = history::selectEntry(cfg, entries);
        name = opts.positional.empty()
                   ? history::promptAliasName(command, std::cin, std::cout)
                   : opts.positional[0];
        if (!isValidAliasName(name)) {
            core::error(cfg, "Invalid alias name: '" + name + "'");
        }
    }

    if (core::trim(command).empty()) {
        core::error(cfg, "Command for alias '" + name + "' is empty");
    }

    auto store = openStore(cfg);
    core::ok(cfg, addAlias(store, name, command, scope));
    core::auditLog(cfg, "add", {name});
    return 0;
}

int cmd_remove(const core::Config& cfg, const std::vector<std::string>& args) {
    Options opts = parseOptions(args);
    std::optional<storage::Scope> scope = scopeFromOptions(opts);

    if (opts.all) {
        if (!opts.positional.empty()) {
            core::error(cfg, "Usage: aka remove --all [--scope DIR|global] [--recursive] [--force]");
        }
        auto store = openStore(cfg);
        if (!opts.force) {
            std::string question = scope
                ? "Remove all aliases in scope '" + scopeLabel(*scope) + "'? [y/N] "
                : "Remove all aliases? [y/N] ";
            if (!confirm(question, std::cin, std::cout)) {
                throw core::OperationCancelled();
            }
        }
        core::ok(cfg, removeAliases(store, scope));
        core::auditLog(cfg, "remove_all", {scope ? scopeLabel(*scope) : std::string("*")});
        return 0;
    }

    if (opts.positional.size() != 1) {
        core::error(cfg, "Usage: aka remove <name> [--scope DIR|global] [--recursive]");
    }

    const std::string& name = opts.positional[0];
    auto store = openStore(cfg);
    core::ok(cfg, removeAlias(store, name, scope));
    core::auditLog(cfg, "remove", {name});
    return 0;
}

int cmd_list(const core::Config& cfg, const std::vector<std::string>& args) {
    Options opts = parseOptions(args);
    auto store = openStore(cfg);

    storage::AliasMap aliases = store.list();
    if (!opts.all) {
        aliases = storage::filterForDirectory(aliases, system::getCwd());
    }

    if (cfg.json) {
        std::cout << formatAliasJson(aliases) << "\n";
        return 0;
    }

    if (aliases.empty()) {
        std::cout << "No aliases found\n";
        return 0;
    }
    std::cout << formatAliasList(aliases);
    return 0;
}

int cmd_init(const core::Config& cfg, const std::vector<std::string>& args) {
    Options opts = parseOptions(args);

    if (opts.dump) {
        auto store = openStore(cfg);
        std::cout << shell::renderDump(store.list());
        return 0;
    }

    std::string executable = cfg.executable.empty() ? std::string("aka") : cfg.executable;
    std::cout << shell::renderBootstrap(executable);
    return 0;
}

int cmd_install(const core::Config& cfg, const std::vector<std::string>& args) {
    (void)args; // Parameter intentionally unused

    // Under sudo the hook goes into the invoking user's profile
    system::TargetUser targetUser = system::resolveTargetUser();
    system::InstallResult result = system::installShellHook(targetUser.home, targetUser.shellName);

    std::string rcName = std::filesystem::path(result.rcFile).filename().string();
    if (result.alreadyInstalled) {
        core::info(cfg, "Already installed in " + rcName);
        return 0;
    }

    core::ok(cfg, "Added aka to " + rcName + ". Restart your shell or run: source " + result.rcFile);
    core::auditLog(cfg, "install", {result.rcFile});
    return 0;
}

int cmd_completion(const core::Config& cfg, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        core::error(cfg, "Usage: aka completion <shell>\nSupported shells: bash, zsh");
    }

    std::string shell = args[1];
    if (shell == "bash") {
        cli::generateBashCompletion();
    } else if (shell == "zsh") {
        cli::generateZshCompletion();
    } else {
        core::error(cfg, "Unsupported shell: " + shell + "\nSupported shells: bash, zsh");
    }

    return 0;
}

int cmd_version(const core::Config& cfg, const std::vector<std::string>& args) {
    (void)cfg;
    (void)args;
    std::cout << ui::colorize("aka", ui::Colors::BRIGHT_CYAN + ui::Colors::BOLD) << " "
              << ui::colorize(core::AKA_VERSION, ui::Colors::BRIGHT_WHITE) << "\n";
    return 0;
}

int cmd_help(const core::Config& cfg, const std::vector<std::string>& args) {
    (void)cfg;
    (void)args;
    cli::cmd_help();
    return 0;
}

int cmd_welcome(const core::Config& cfg, const std::vector<std::string>& args) {
    (void)cfg;
    (void)args;
    cli::showWelcome();
    return 0;
}

int cmd_implicit(const core::Config& cfg, const std::vector<std::string>& args) {
    Options opts = parseOptions(args, 0);

    std::vector<std::string> forwarded;
    switch (opts.positional.size()) {
    case 0:
        forwarded.push_back("list");
        break;
    case 1:
        forwarded.push_back("remove");
        break;
    case 2:
        forwarded.push_back("add");
        break;
    default:
        core::error(cfg, "Unknown command '" + args[0] + "' (try: aka help)");
        return 1;
    }

    forwarded.insert(forwarded.end(), args.begin(), args.end());
    if (forwarded[0] == "list") {
        return cmd_list(cfg, forwarded);
    }
    return forwarded[0] == "add" ? cmd_add(cfg, forwarded) : cmd_remove(cfg, forwarded);
}

} // namespace commands
} // namespace aka
