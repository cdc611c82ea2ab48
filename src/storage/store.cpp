#include "storage/store.hpp"
#include "storage/codec.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace aka {
namespace storage {

namespace {

// Definitions of one alias in registration order, unique per scope
class Record {
public:
    Record() = default;
    explicit Record(DefinitionList definitions) : definitions_(std::move(definitions)) {}

    static Record load(const ReadTransaction& txn, const std::string& name) {
        auto value = txn.get(name);
        if (!value) {
            return Record();
        }
        return Record(decodeStoredValue(*value));
    }

    void upsert(const Definition& def) {
        take(def.scope);
        definitions_.push_back(def);
    }

    // Removes the definitions registered for exactly this scope
    DefinitionList take(const Scope& scope) {
        DefinitionList removed;
        auto keep = std::stable_partition(definitions_.begin(), definitions_.end(),
                                          [&scope](const Definition& d) { return d.scope != scope; });
        removed.assign(keep, definitions_.end());
        definitions_.erase(keep, definitions_.end());
        return removed;
    }

    // Writes the record back, or deletes the key once nothing is left
    void store(WriteTransaction& txn, const std::string& name) const {
        if (definitions_.empty()) {
            txn.remove(name);
        } else {
            txn.insert(name, encodeDefinitions(definitions_));
        }
    }

private:
    DefinitionList definitions_;
};

} // namespace

AliasStore::AliasStore(std::unique_ptr<Database> db)
    : db_(std::move(db)) {}

AliasStore AliasStore::open(const core::Config& cfg) {
    return AliasStore(std::make_unique<FileDatabase>(cfg.databasePath));
}

void AliasStore::add(const std::string& name, const std::string& command, const Scope& scope) {
    auto txn = db_->beginWrite();
    Record record = Record::load(*txn, name);
    record.upsert(Definition{command, scope});
    record.store(*txn, name);
    txn->commit();
}

std::optional<DefinitionList> AliasStore::remove(const std::string& name) {
    auto txn = db_->beginWrite();
    auto previous = txn->remove(name);
    if (!previous) {
        return std::nullopt;
    }
    txn->commit();
    return decodeStoredValue(*previous);
}

std::optional<Definition> AliasStore::removeScope(const std::string& name, const Scope& scope) {
    auto txn = db_->beginWrite();
    Record record = Record::load(*txn, name);
    DefinitionList removed = record.take(scope);
    if (removed.empty()) {
        return std::nullopt;
    }
    record.store(*txn, name);
    txn->commit();
    return removed.front();
}

size_t AliasStore::removeAll() {
    auto txn = db_->beginWrite();
    Entries entries = txn->entries();
    for (const auto& entry : entries) {
        txn->remove(entry.first);
    }
    txn->commit();
    return entries.size();
}

AliasMap AliasStore::removeAllInScope(const Scope& scope) {
    auto txn = db_->beginWrite();
    AliasMap removedByName;

    for (const auto& [name, value] : txn->entries()) {
        Record record(decodeStoredValue(value));
        DefinitionList removed = record.take(scope);
        if (removed.empty()) {
            continue;
        }
        record.store(*txn, name);
        removedByName.emplace(name, std::move(removed));
    }

    txn->commit();
    return removedByName;
}

AliasMap AliasStore::list() const {
    auto txn = db_->beginRead();
    AliasMap aliases;
    for (const auto& [name, value] : txn->entries()) {
        aliases.emplace(name, decodeStoredValue(value));
    }
    return aliases;
}

AliasMap filterForDirectory(const AliasMap& aliases, const std::string& dir) {
    AliasMap active;
    for (const auto& [name, definitions] : aliases) {
        DefinitionList matching;
        for (const auto& def : definitions) {
            if (def.scope.matches(dir)) {
                matching.push_back(def);
            }
        }
        if (!matching.empty()) {
            active.emplace(name, std::move(matching));
        }
    }
    return active;
}

} // namespace storage
} // namespace aka
