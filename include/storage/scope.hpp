#pragma once

#include <map>
#include <string>
#include <vector>

namespace aka {
namespace storage {

// Directory context in which one definition of an alias is active.
// Exact and Recursive carry a canonical absolute path; Global carries none.
struct Scope {
    enum class Kind {
        Global,
        Exact,
        Recursive
    };

    Kind kind = Kind::Global;
    std::string path;

    static Scope global();
    static Scope exact(const std::string& path);
    static Scope recursive(const std::string& path);

    bool isGlobal() const { return kind == Kind::Global; }

    // Global always matches, Exact on equality, Recursive on string prefix
    bool matches(const std::string& dir) const;

    // "Global", "Exact: /p" or "Recursive: /p"
    std::string describe() const;
};

bool operator==(const Scope& a, const Scope& b);
bool operator!=(const Scope& a, const Scope& b);
// Strict weak order for use as a map key (kind, then path)
bool operator<(const Scope& a, const Scope& b);

// Generation precedence: Exact before Recursive before Global, longer paths
// first within a kind
bool precedes(const Scope& a, const Scope& b);

struct Definition {
    std::string command;
    Scope scope;
};

bool operator==(const Definition& a, const Definition& b);
bool operator!=(const Definition& a, const Definition& b);

using DefinitionList = std::vector<Definition>;
using AliasMap = std::map<std::string, DefinitionList>;

// Resolves a user supplied directory (relative to the working directory) to
// a canonical path. Throws core::InvalidScope when it is not an existing
// directory.
Scope resolveScope(const std::string& dir, bool recursive);

// "global" (any case) names the Global scope, anything else is a directory
Scope parseScopeArgument(const std::string& value, bool recursive);

} // namespace storage
} // namespace aka
