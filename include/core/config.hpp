#pragma once

#include <string>
#include <vector>

namespace aka {
namespace core {

// Version
extern const std::string AKA_VERSION;

// Configuration structure
struct Config {
    std::string dataDir;         // $AKA_DATA_DIR/aka, $XDG_DATA_HOME/aka or $HOME/.local/share/aka
    std::string databasePath;    // aliases.db
    std::string auditLogPath;
    std::string historyFile;     // AKA_HISTORY_FILE
    std::string fzfBinary = "fzf"; // AKA_FZF_BIN
    std::string executable;      // absolute path of this binary, for `aka init`
    bool json = false;
};

Config loadConfig();

// Utility functions
bool commandExists(const std::string& cmd);
std::string getenvs(const char* key, const std::string& defaultValue = "");
std::string trim(const std::string& str);
std::string toLower(std::string str);
std::string shellQuote(const std::string& str);

// Error handling and output
void error(const Config& cfg, const std::string& msg, int code = 1);
void ok(const Config& cfg, const std::string& msg);
void info(const Config& cfg, const std::string& msg);

// Audit logging
std::string isoTimeUTC();
void auditLog(const Config& cfg, const std::string& action, const std::vector<std::string>& names);

} // namespace core
} // namespace aka
