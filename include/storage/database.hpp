#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace aka {
namespace storage {

using Entries = std::vector<std::pair<std::string, std::string>>;

// Consistent view of the table for the lifetime of the transaction
class ReadTransaction {
public:
    virtual ~ReadTransaction() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;
    // All entries ordered by key
    virtual Entries entries() const = 0;
};

// Changes are private to the transaction until commit() succeeds; a
// transaction destroyed without commit leaves the table untouched.
class WriteTransaction : public ReadTransaction {
public:
    virtual void insert(const std::string& key, const std::string& value) = 0;
    // Returns the previous value, if any
    virtual std::optional<std::string> remove(const std::string& key) = 0;
    // Throws core::StorageFailure; the table is unchanged on failure
    virtual void commit() = 0;
};

// Ordered, durable key-value table with transactions
class Database {
public:
    virtual ~Database() = default;

    virtual std::unique_ptr<ReadTransaction> beginRead() = 0;
    virtual std::unique_ptr<WriteTransaction> beginWrite() = 0;
};

// One text file guarded by an advisory lock file next to it. Readers take a
// shared lock, a write transaction holds an exclusive lock until it is
// destroyed; commit replaces the file through a rename.
class FileDatabase : public Database {
public:
    // Creates parent directories. Throws core::StorageFailure when the path
    // cannot hold a table (e.g. it is a directory).
    explicit FileDatabase(const std::string& path);

    std::unique_ptr<ReadTransaction> beginRead() override;
    std::unique_ptr<WriteTransaction> beginWrite() override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::string lockPath_;
};

class MemoryDatabase : public Database {
public:
    std::unique_ptr<ReadTransaction> beginRead() override;
    std::unique_ptr<WriteTransaction> beginWrite() override;

private:
    std::map<std::string, std::string> table_;
};

// Table file format helpers
std::map<std::string, std::string> parseTable(const std::string& data);
std::string serializeTable(const std::map<std::string, std::string>& table);

// fsync of a file, or of a directory so that a rename inside it persists.
// False when the path cannot be opened or synced.
bool syncPath(const std::string& path, bool directory);

} // namespace storage
} // namespace aka
