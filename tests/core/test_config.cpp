#include "gtest/gtest.h"
#include "core/config.hpp"
#include "core/errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

using namespace aka::core;

namespace {

// Sets or clears an environment variable for the lifetime of the object
class ScopedEnv {
public:
    ScopedEnv(const char* key, const char* value) : key_(key) {
        if (const char* old = std::getenv(key)) {
            previous_ = std::string(old);
        }
        if (value) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }
    ~ScopedEnv() {
        if (previous_) {
            setenv(key_.c_str(), previous_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

private:
    std::string key_;
    std::optional<std::string> previous_;
};

} // namespace

TEST(StringUtilityFunctions, trimFunction) {
    ASSERT_EQ(trim(""), "");
    ASSERT_EQ(trim("hello"), "hello");
    ASSERT_EQ(trim("  hello  "), "hello");
    ASSERT_EQ(trim("\t\nhello\t\n"), "hello");
    ASSERT_EQ(trim("   "), "");
    ASSERT_EQ(trim("  git status  "), "git status");
}

TEST(StringUtilityFunctions, toLowerFunction) {
    ASSERT_EQ(toLower(""), "");
    ASSERT_EQ(toLower("GLOBAL"), "global");
    ASSERT_EQ(toLower("Global"), "global");
    ASSERT_EQ(toLower("MixedCase123"), "mixedcase123");
}

TEST(ShellQuoteFunction, WrapsInSingleQuotes) {
    ASSERT_EQ(shellQuote(""), "''");
    ASSERT_EQ(shellQuote("/usr/bin/aka"), "'/usr/bin/aka'");
    ASSERT_EQ(shellQuote("a b"), "'a b'");
}

TEST(ShellQuoteFunction, EscapesEmbeddedSingleQuotes) {
    ASSERT_EQ(shellQuote("it's"), "'it'\\''s'");
}

TEST(ConfigStructure, ConfigInitialization) {
    Config cfg;
    ASSERT_FALSE(cfg.json);
    ASSERT_EQ(cfg.fzfBinary, "fzf");
    ASSERT_TRUE(cfg.dataDir.empty());
    ASSERT_TRUE(cfg.databasePath.empty());
    ASSERT_TRUE(cfg.auditLogPath.empty());
    ASSERT_TRUE(cfg.executable.empty());
}

TEST(LoadConfigFunction, UsesAkaDataDir) {
    ScopedEnv data("AKA_DATA_DIR", "/srv/data");
    ScopedEnv legacy("aka_DATA_DIR", nullptr);

    Config cfg = loadConfig();
    ASSERT_EQ(cfg.dataDir, "/srv/data/aka");
    ASSERT_EQ(cfg.databasePath, "/srv/data/aka/aliases.db");
    ASSERT_EQ(cfg.auditLogPath, "/srv/data/aka/audit.log");
}

TEST(LoadConfigFunction, AcceptsLegacyLowercaseVariable) {
    ScopedEnv data("AKA_DATA_DIR", nullptr);
    ScopedEnv legacy("aka_DATA_DIR", "/old/place");

    Config cfg = loadConfig();
    ASSERT_EQ(cfg.dataDir, "/old/place/aka");
}

TEST(LoadConfigFunction, FallsBackToXdgDataHome) {
    ScopedEnv data("AKA_DATA_DIR", nullptr);
    ScopedEnv legacy("aka_DATA_DIR", nullptr);
    ScopedEnv xdg("XDG_DATA_HOME", "/xdg");

    Config cfg = loadConfig();
    ASSERT_EQ(cfg.dataDir, "/xdg/aka");
}

TEST(LoadConfigFunction, FallsBackToHomeLocalShare) {
    ScopedEnv data("AKA_DATA_DIR", nullptr);
    ScopedEnv legacy("aka_DATA_DIR", nullptr);
    ScopedEnv xdg("XDG_DATA_HOME", nullptr);
    ScopedEnv home("HOME", "/home/tester");

    Config cfg = loadConfig();
    ASSERT_EQ(cfg.dataDir, "/home/tester/.local/share/aka");
}

TEST(LoadConfigFunction, ThrowsWithoutAnyBaseDirectory) {
    ScopedEnv data("AKA_DATA_DIR", nullptr);
    ScopedEnv legacy("aka_DATA_DIR", nullptr);
    ScopedEnv xdg("XDG_DATA_HOME", nullptr);
    ScopedEnv home("HOME", nullptr);

    ASSERT_THROW(loadConfig(), ConfigError);
}

TEST(LoadConfigFunction, ReadsSelectorAndHistoryOverrides) {
    ScopedEnv data("AKA_DATA_DIR", "/srv/data");
    ScopedEnv fzf("AKA_FZF_BIN", "/opt/bin/sk");
    ScopedEnv hist("AKA_HISTORY_FILE", "/tmp/history");

    Config cfg = loadConfig();
    ASSERT_EQ(cfg.fzfBinary, "/opt/bin/sk");
    ASSERT_EQ(cfg.historyFile, "/tmp/history");
}

TEST(CommandExistsFunction, ShouldDetectExistingCommands) {
    ASSERT_TRUE(commandExists("ls"));
    ASSERT_TRUE(commandExists("sh"));
}

TEST(CommandExistsFunction, ShouldNotDetectNonExistingCommands) {
    ASSERT_FALSE(commandExists("nonexistent_command_12345"));
}

TEST(GetenvsFunction, ShouldReturnDefaultForNonExistentVariable) {
    ASSERT_EQ(getenvs("NONEXISTENT_VAR_12345"), "");
    ASSERT_EQ(getenvs("NONEXISTENT_VAR_12345", "default"), "default");
}

TEST(ErrorMessages, CarryTheUserFacingText) {
    ASSERT_STREQ(AliasNotFound("ghost").what(), "Alias not found: ghost");
    ASSERT_EQ(AliasNotFound("ghost").alias(), "ghost");
    ASSERT_STREQ(InvalidScope("/nope").what(), "Invalid scope path: /nope");
    ASSERT_STREQ(OperationCancelled().what(), "Operation cancelled");
    ASSERT_STREQ(ScopeNotFound("foo", "global").what(),
                 "No definition found for alias 'foo' in scope 'global'");
    ASSERT_STREQ(StorageFailure("disk full").what(), "Storage error: disk full");
}

TEST(AuditLogFunction, AppendsOneLinePerName) {
    auto dir = std::filesystem::temp_directory_path() / "aka-test-audit";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    Config cfg;
    cfg.auditLogPath = (dir / "audit.log").string();
    auditLog(cfg, "add", {"gs", "ll"});

    std::ifstream in(cfg.auditLogPath);
    std::string first, second, extra;
    ASSERT_TRUE(std::getline(in, first));
    ASSERT_TRUE(std::getline(in, second));
    ASSERT_FALSE(std::getline(in, extra));
    ASSERT_NE(first.find(" add gs"), std::string::npos);
    ASSERT_NE(second.find(" add ll"), std::string::npos);
    ASSERT_EQ(first.back(), 's');

    std::filesystem::remove_all(dir);
}
