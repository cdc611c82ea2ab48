#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace aka {
namespace core {
struct Config;
}

namespace history {

constexpr size_t DEFAULT_HISTORY_LIMIT = 200;

// AKA_HISTORY_FILE, HISTFILE, ~/.zsh_history, ~/.bash_history, first hit wins.
// Throws core::ConfigError when none applies.
std::string resolveHistoryPath(const core::Config& cfg);

// Command part of one history line; nothing for bash timestamp lines
std::optional<std::string> parseHistoryLine(const std::string& line);

// Newest first, de-duplicated, at most `limit` commands (0 = default)
std::vector<std::string> readHistoryEntries(const std::string& path, size_t limit);

// Runs the fuzzy selector over the entries. Throws core::ConfigError when the
// selector binary is missing and core::OperationCancelled when nothing is picked.
std::string selectEntry(const core::Config& cfg, const std::vector<std::string>& entries);

// Asks until a non-empty name is entered
std::string promptAliasName(const std::string& command, std::istream& in, std::ostream& out);

// Replaces malformed UTF-8 sequences with U+FFFD
std::string sanitizeUtf8(const std::string& bytes);

} // namespace history
} // namespace aka
