#pragma once

#include "core/config.hpp"
#include "storage/scope.hpp"
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace aka {
namespace storage {
class AliasStore;
}

namespace commands {

// Command handler type definition; args[0] is the command word itself
using CommandHandler = int(*)(const core::Config& cfg, const std::vector<std::string>& args);

// Individual command handlers
int cmd_add(const core::Config& cfg, const std::vector<std::string>& args);
int cmd_remove(const core::Config& cfg, const std::vector<std::string>& args);
int cmd_list(const core::Config& cfg, const std::vector<std::string>& args);
int cmd_init(const core::Config& cfg, const std::vector<std::string>& args);
int cmd_install(const core::Config& cfg, const std::vector<std::string>& args);
int cmd_completion(const core::Config& cfg, const std::vector<std::string>& args);
int cmd_version(const core::Config& cfg, const std::vector<std::string>& args);
int cmd_help(const core::Config& cfg, const std::vector<std::string>& args);
int cmd_welcome(const core::Config& cfg, const std::vector<std::string>& args);

// `aka <name>` removes, `aka <name> <command>` adds
int cmd_implicit(const core::Config& cfg, const std::vector<std::string>& args);

// Flags shared by the alias commands
struct Options {
    std::vector<std::string> positional;
    bool scopeGiven = false;
    std::string scopeValue;      // empty: --scope without a directory
    bool recursive = false;
    bool all = false;
    bool force = false;
    bool dump = false;
    size_t limit = 0;
};

// Parses everything after the command word. Throws core::UsageError.
Options parseOptions(const std::vector<std::string>& args, size_t first = 1);

// Scope selected by --scope/--recursive; nothing when neither was given.
// Throws core::InvalidScope for a directory that does not exist.
std::optional<storage::Scope> scopeFromOptions(const Options& opts);

bool isValidAliasName(const std::string& name);

// "global" or the scope's directory, as shown in remove messages
std::string scopeLabel(const storage::Scope& scope);

// Store operations behind the handlers; each returns the message to print
std::string addAlias(storage::AliasStore& store, const std::string& name,
                     const std::string& command, const storage::Scope& scope);
std::string removeAlias(storage::AliasStore& store, const std::string& name,
                        const std::optional<storage::Scope>& scope);
std::string removeAliases(storage::AliasStore& store, const std::optional<storage::Scope>& scope);

// One line per definition: name = 'command' (Scope)
std::string formatAliasList(const storage::AliasMap& aliases);
std::string formatAliasJson(const storage::AliasMap& aliases);

// y/yes (any case) confirms; anything else, including EOF, declines
bool confirm(const std::string& prompt, std::istream& in, std::ostream& out);

} // namespace commands
} // namespace aka
