#pragma once

#include <string>
#include <filesystem>

namespace aka {
namespace system {

// Line `aka install` adds to the shell profile
extern const std::string INIT_LINE;
extern const std::string INSTALL_COMMENT;

void ensureSecureDir(const std::filesystem::path& path);

// Process execution
std::string runCmdCapture(const std::string& cmd, int* exitCode = nullptr);

// Working directory
std::string getCwd();

// Absolute path of the running binary, argv0 when it cannot be resolved
std::string executablePath(const std::string& argv0);

// File utilities
bool fileContains(const std::string& path, const std::string& needle);
void appendLine(const std::string& path, const std::string& line);

// User information
struct TargetUser {
    std::string userName;
    std::string home;
    std::string shellName;
};

TargetUser resolveTargetUser();

// Shell integration
std::string rcFileFor(const std::string& home, const std::string& shellName);

struct InstallResult {
    std::string rcFile;
    bool alreadyInstalled = false;
};

// Appends INIT_LINE to the profile unless it is already there
InstallResult installShellHook(const std::string& home, const std::string& shellName);

} // namespace system
} // namespace aka
