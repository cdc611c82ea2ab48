#include "storage/scope.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include <filesystem>
#include <system_error>
#include <tuple>

namespace aka {
namespace storage {

namespace fs = std::filesystem;

Scope Scope::global() {
    return Scope{};
}

Scope Scope::exact(const std::string& path) {
    Scope scope;
    scope.kind = Kind::Exact;
    scope.path = path;
    return scope;
}

Scope Scope::recursive(const std::string& path) {
    Scope scope;
    scope.kind = Kind::Recursive;
    scope.path = path;
    return scope;
}

bool Scope::matches(const std::string& dir) const {
    switch (kind) {
    case Kind::Global:
        return true;
    case Kind::Exact:
        return dir == path;
    case Kind::Recursive:
        return dir.compare(0, path.size(), path) == 0;
    }
    return false;
}

std::string Scope::describe() const {
    switch (kind) {
    case Kind::Global:
        return "Global";
    case Kind::Exact:
        return "Exact: " + path;
    case Kind::Recursive:
        return "Recursive: " + path;
    }
    return "Global";
}

bool operator==(const Scope& a, const Scope& b) {
    if (a.kind != b.kind) {
        return false;
    }
    return a.kind == Scope::Kind::Global || a.path == b.path;
}

bool operator!=(const Scope& a, const Scope& b) {
    return !(a == b);
}

bool operator<(const Scope& a, const Scope& b) {
    const std::string& pa = a.isGlobal() ? std::string() : a.path;
    const std::string& pb = b.isGlobal() ? std::string() : b.path;
    return std::tie(a.kind, pa) < std::tie(b.kind, pb);
}

namespace {

int rank(Scope::Kind kind) {
    switch (kind) {
    case Scope::Kind::Exact:
        return 0;
    case Scope::Kind::Recursive:
        return 1;
    case Scope::Kind::Global:
        return 2;
    }
    return 2;
}

} // namespace

bool precedes(const Scope& a, const Scope& b) {
    if (rank(a.kind) != rank(b.kind)) {
        return rank(a.kind) < rank(b.kind);
    }
    if (a.isGlobal()) {
        return false;
    }
    if (a.path.size() != b.path.size()) {
        return a.path.size() > b.path.size();
    }
    return a.path < b.path;
}

bool operator==(const Definition& a, const Definition& b) {
    return a.command == b.command && a.scope == b.scope;
}

bool operator!=(const Definition& a, const Definition& b) {
    return !(a == b);
}

Scope resolveScope(const std::string& dir, bool recursive) {
    std::string requested = dir.empty() ? std::string(".") : dir;

    std::error_code ec;
    fs::path canonical = fs::canonical(fs::path(requested), ec);
    if (ec || !fs::is_directory(canonical, ec)) {
        throw core::InvalidScope(requested);
    }

    std::string path = canonical.string();
    // canonical() keeps no trailing separator except for the root itself
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return recursive ? Scope::recursive(path) : Scope::exact(path);
}

Scope parseScopeArgument(const std::string& value, bool recursive) {
    if (core::toLower(value) == "global") {
        return Scope::global();
    }
    return resolveScope(value, recursive);
}

} // namespace storage
} // namespace aka
