#include "gtest/gtest.h"
#include "storage/scope.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace aka::storage;
namespace fs = std::filesystem;

TEST(ScopeMatching, GlobalMatchesEverywhere) {
    Scope scope = Scope::global();
    ASSERT_TRUE(scope.matches("/"));
    ASSERT_TRUE(scope.matches("/home/user/project"));
    ASSERT_TRUE(scope.matches(""));
}

TEST(ScopeMatching, ExactMatchesOnlyThatDirectory) {
    Scope scope = Scope::exact("/home/user/project");
    ASSERT_TRUE(scope.matches("/home/user/project"));
    ASSERT_FALSE(scope.matches("/home/user/project/src"));
    ASSERT_FALSE(scope.matches("/home/user"));
}

TEST(ScopeMatching, RecursiveMatchesDirectoryAndDescendants) {
    Scope scope = Scope::recursive("/home/user/project");
    ASSERT_TRUE(scope.matches("/home/user/project"));
    ASSERT_TRUE(scope.matches("/home/user/project/src/lib"));
    ASSERT_FALSE(scope.matches("/home/user"));
}

TEST(ScopeMatching, RecursiveIsAPlainStringPrefix) {
    // Sibling directories sharing the prefix match as well
    Scope scope = Scope::recursive("/home/user/project");
    ASSERT_TRUE(scope.matches("/home/user/project-old"));
}

TEST(ScopeDescribe, NamesKindAndPath) {
    ASSERT_EQ(Scope::global().describe(), "Global");
    ASSERT_EQ(Scope::exact("/a/b").describe(), "Exact: /a/b");
    ASSERT_EQ(Scope::recursive("/tmp").describe(), "Recursive: /tmp");
}

TEST(ScopeEquality, ComparesKindAndPath) {
    ASSERT_EQ(Scope::global(), Scope::global());
    ASSERT_EQ(Scope::exact("/a"), Scope::exact("/a"));
    ASSERT_NE(Scope::exact("/a"), Scope::recursive("/a"));
    ASSERT_NE(Scope::recursive("/a"), Scope::recursive("/a/b"));
    ASSERT_NE(Scope::global(), Scope::exact("/"));
}

TEST(ScopePrecedence, ExactBeforeRecursiveBeforeGlobal) {
    ASSERT_TRUE(precedes(Scope::exact("/a"), Scope::recursive("/a/b/c")));
    ASSERT_TRUE(precedes(Scope::recursive("/"), Scope::global()));
    ASSERT_TRUE(precedes(Scope::exact("/"), Scope::global()));
    ASSERT_FALSE(precedes(Scope::global(), Scope::exact("/a")));
}

TEST(ScopePrecedence, LongerPathFirstWithinAKind) {
    ASSERT_TRUE(precedes(Scope::recursive("/a/b"), Scope::recursive("/a")));
    ASSERT_FALSE(precedes(Scope::recursive("/a"), Scope::recursive("/a/b")));
    ASSERT_TRUE(precedes(Scope::exact("/long/path"), Scope::exact("/short")));
}

TEST(ScopePrecedence, SortsAMixedList) {
    std::vector<Scope> scopes = {
        Scope::global(),
        Scope::recursive("/a"),
        Scope::exact("/a/b"),
        Scope::recursive("/a/b"),
    };
    std::stable_sort(scopes.begin(), scopes.end(), precedes);

    ASSERT_EQ(scopes[0], Scope::exact("/a/b"));
    ASSERT_EQ(scopes[1], Scope::recursive("/a/b"));
    ASSERT_EQ(scopes[2], Scope::recursive("/a"));
    ASSERT_EQ(scopes[3], Scope::global());
}

TEST(ResolveScopeFunction, CanonicalizesExistingDirectory) {
    fs::path tmp = fs::canonical(fs::temp_directory_path());
    Scope scope = resolveScope(tmp.string() + "/.", false);
    ASSERT_EQ(scope.kind, Scope::Kind::Exact);
    ASSERT_EQ(scope.path, tmp.string());
}

TEST(ResolveScopeFunction, RecursiveFlagSelectsRecursiveKind) {
    fs::path tmp = fs::canonical(fs::temp_directory_path());
    Scope scope = resolveScope(tmp.string(), true);
    ASSERT_EQ(scope.kind, Scope::Kind::Recursive);
    ASSERT_EQ(scope.path, tmp.string());
}

TEST(ResolveScopeFunction, EmptyMeansWorkingDirectory) {
    Scope scope = resolveScope("", false);
    ASSERT_EQ(scope.path, fs::canonical(fs::current_path()).string());
}

TEST(ResolveScopeFunction, MissingDirectoryIsInvalid) {
    ASSERT_THROW(resolveScope("/nonexistent/aka/scope/dir", false), aka::core::InvalidScope);
}

TEST(ResolveScopeFunction, RegularFileIsInvalid) {
    fs::path file = fs::temp_directory_path() / "aka-test-scope-file";
    { std::ofstream(file.string()) << "x"; }
    ASSERT_THROW(resolveScope(file.string(), false), aka::core::InvalidScope);
    fs::remove(file);
}

TEST(ParseScopeArgumentFunction, GlobalKeywordInAnyCase) {
    ASSERT_TRUE(parseScopeArgument("global", false).isGlobal());
    ASSERT_TRUE(parseScopeArgument("GLOBAL", true).isGlobal());
    ASSERT_TRUE(parseScopeArgument("Global", false).isGlobal());
}

TEST(ParseScopeArgumentFunction, DirectoryOtherwise) {
    fs::path tmp = fs::canonical(fs::temp_directory_path());
    Scope scope = parseScopeArgument(tmp.string(), false);
    ASSERT_EQ(scope, Scope::exact(tmp.string()));
}
