#include "system/system.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#ifdef __unix__
#include <unistd.h>
#include <pwd.h>
#include <sys/stat.h>
#endif

namespace aka {
namespace system {

namespace fs = std::filesystem;

const std::string INIT_LINE = "eval \"$(aka init)\"";
const std::string INSTALL_COMMENT = "# aka alias manager";

void ensureSecureDir(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        fs::create_directories(path, ec);
        if (ec) {
            throw core::StorageFailure("cannot create " + path.string() + ": " + ec.message());
        }
    }
#ifdef __unix__
    ::chmod(path.c_str(), 0700);
#endif
}

// Process execution
std::string runCmdCapture(const std::string& cmd, int* exitCode) {
    std::array<char, 4096> buffer{};
    std::string result;

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        if (exitCode) *exitCode = -1;
        return {};
    }

    size_t bytesRead;
    while ((bytesRead = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.append(buffer.data(), bytesRead);
    }

    int rc = pclose(pipe);
    if (exitCode) *exitCode = rc;
    return result;
}

std::string getCwd() {
    return fs::current_path().string();
}

std::string executablePath(const std::string& argv0) {
#ifdef __linux__
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) {
        return self.string();
    }
#endif
    if (argv0.find('/') != std::string::npos) {
        std::error_code ec;
        fs::path absolute = fs::absolute(argv0, ec);
        if (!ec) {
            return absolute.lexically_normal().string();
        }
    }
    return argv0;
}

// File utilities
bool fileContains(const std::string& path, const std::string& needle) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void appendLine(const std::string& path, const std::string& line) {
    std::ofstream file(path, std::ios::app);
    if (!file.is_open()) {
        throw core::ConfigError("cannot write " + path);
    }
    file << line << "\n";
}

TargetUser resolveTargetUser() {
    TargetUser user;

#ifdef __unix__
    // Running under sudo: install into the invoking user's profile
    const char* sudoUser = getenv("SUDO_USER");
    struct passwd* pwd = sudoUser ? getpwnam(sudoUser) : getpwuid(getuid());
    if (pwd) {
        user.userName = pwd->pw_name;
        user.home = pwd->pw_dir;
        if (pwd->pw_shell) {
            user.shellName = fs::path(pwd->pw_shell).filename().string();
        }
    }
#endif

    if (user.home.empty()) {
        user.home = core::getenvs("HOME");
    }
    if (user.shellName.empty()) {
        user.shellName = fs::path(core::getenvs("SHELL", "zsh")).filename().string();
    }
    return user;
}

std::string rcFileFor(const std::string& home, const std::string& shellName) {
    if (shellName == "bash") {
        return (fs::path(home) / ".bashrc").string();
    }
    return (fs::path(home) / ".zshrc").string();
}

InstallResult installShellHook(const std::string& home, const std::string& shellName) {
    if (home.empty()) {
        throw core::ConfigError("Home directory not found");
    }

    InstallResult result;
    result.rcFile = rcFileFor(home, shellName);
    if (fileContains(result.rcFile, INIT_LINE)) {
        result.alreadyInstalled = true;
        return result;
    }

    appendLine(result.rcFile, "");
    appendLine(result.rcFile, INSTALL_COMMENT);
    appendLine(result.rcFile, INIT_LINE);
    return result;
}

} // namespace system
} // namespace aka
