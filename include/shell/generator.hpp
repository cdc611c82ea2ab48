#pragma once

#include "storage/scope.hpp"
#include <string>

namespace aka {
namespace shell {

// Shell variable listing the functions installed by the last dump
extern const std::string FUNCTIONS_MARKER;

// Names every supported shell accepts in `name() {`: letters, digits and
// _ . : + - , not starting with '-' and not a reserved word
bool isValidFunctionName(const std::string& name);

// Rewrites every "@<digit>" placeholder to "$<digit>"
std::string replacePlaceholders(const std::string& command);

// True when the command already expands a positional ($1, ${2}) or special
// ($@, $*, $#) parameter outside single quotes
bool hasPositionalArgs(const std::string& command);

// Placeholder rewrite plus a trailing "$@" when the command takes no
// arguments of its own
std::string renderCommand(const std::string& command);

storage::DefinitionList sortByPrecedence(storage::DefinitionList definitions);

// Prefixes "command " when the command runs the program the alias shadows,
// so `ls` -> `ls -la` does not call itself
std::string guardSelfCall(const std::string& name, const std::string& command);

// Function definition routing on $PWD, preceded by guards that clear an
// alias or function of the same name
std::string renderFunction(const std::string& name, const storage::DefinitionList& definitions);

// Output of `aka init --dump`. Names failing isValidFunctionName are skipped.
std::string renderDump(const storage::AliasMap& aliases);

// Output of `aka init`: prompt hook that re-runs the dump
std::string renderBootstrap(const std::string& executable);

// Double-quoted shell word with \ " $ ` escaped
std::string doubleQuote(const std::string& text);

} // namespace shell
} // namespace aka
