#include "core/config.hpp"
#include "core/errors.hpp"
#include "ui/ui.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <cctype>
#include <cstdlib>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <fstream>

namespace aka {
namespace core {

// Version information
#ifndef AKA_VERSION_STRING
#define AKA_VERSION_STRING "0.4.0"
#endif
const std::string AKA_VERSION = AKA_VERSION_STRING;

Config loadConfig() {
    Config cfg;

    // aka_DATA_DIR is the spelling older releases documented
    std::string base = getenvs("AKA_DATA_DIR", getenvs("aka_DATA_DIR"));
    if (base.empty()) {
        base = getenvs("XDG_DATA_HOME");
    }
    if (base.empty()) {
        std::string home = getenvs("HOME");
        if (home.empty()) {
            throw ConfigError("Data dir not found");
        }
        base = home + "/.local/share";
    }

    cfg.dataDir = base + "/aka";
    cfg.databasePath = cfg.dataDir + "/aliases.db";
    cfg.auditLogPath = cfg.dataDir + "/audit.log";
    cfg.historyFile = getenvs("AKA_HISTORY_FILE");
    cfg.fzfBinary = getenvs("AKA_FZF_BIN", "fzf");
    return cfg;
}

// Utility functions
bool commandExists(const std::string& cmd) {
    std::string command = "command -v " + shellQuote(cmd) + " >/dev/null 2>&1";
    return std::system(command.c_str()) == 0;
}

std::string getenvs(const char* key, const std::string& defaultValue) {
    const char* val = std::getenv(key);
    return val ? std::string(val) : defaultValue;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, (last - first + 1));
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return str;
}

// Wraps a string in single quotes for the shell
std::string shellQuote(const std::string& str) {
    std::string quoted = "'";
    for (char c : str) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

// Error handling and output
void error(const Config& /* cfg */, const std::string& msg, int code) {
    std::cerr << ui::colorize("❌ " + msg, ui::Colors::BRIGHT_RED) << std::endl;
    exit(code);
}

void ok(const Config& /* cfg */, const std::string& msg) {
    std::cout << ui::colorize("✅ " + msg, ui::Colors::BRIGHT_GREEN) << std::endl;
}

void info(const Config& /* cfg */, const std::string& msg) {
    std::cout << ui::colorize("ℹ️  " + msg, ui::Colors::BRIGHT_CYAN) << std::endl;
}

// Audit logging
std::string isoTimeUTC() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

void auditLog(const Config& cfg, const std::string& action, const std::vector<std::string>& names) {
    if (cfg.auditLogPath.empty()) return;

    std::ofstream logFile(cfg.auditLogPath, std::ios::app);
    if (!logFile.is_open()) return;

    std::string timestamp = isoTimeUTC();

    for (const auto& name : names) {
        logFile << timestamp << " " << action << " " << name << std::endl;
    }
}

} // namespace core
} // namespace aka
