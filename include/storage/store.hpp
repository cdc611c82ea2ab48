#pragma once

#include "storage/database.hpp"
#include "storage/scope.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace aka {
namespace core {
struct Config;
}

namespace storage {

// Persistent alias records: name -> definitions, at most one per scope.
// Every operation runs in a single transaction of the underlying table and
// throws core::StorageFailure when that table cannot be read or committed.
class AliasStore {
public:
    explicit AliasStore(std::unique_ptr<Database> db);

    // Opens the file-backed table at cfg.databasePath
    static AliasStore open(const core::Config& cfg);

    // Appends the definition, replacing one registered for the same scope
    void add(const std::string& name, const std::string& command, const Scope& scope);

    std::optional<DefinitionList> remove(const std::string& name);

    // Deletes the record when its last definition goes
    std::optional<Definition> removeScope(const std::string& name, const Scope& scope);

    size_t removeAll();

    // Exact scope equality; Recursive(/a) does not touch Recursive(/a/b)
    AliasMap removeAllInScope(const Scope& scope);

    AliasMap list() const;

private:
    std::unique_ptr<Database> db_;
};

// Active definitions for a directory, as `aka list` shows them
AliasMap filterForDirectory(const AliasMap& aliases, const std::string& dir);

} // namespace storage
} // namespace aka
