#include "storage/database.hpp"
#include "storage/codec.hpp"
#include "core/errors.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#ifdef __unix__
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace aka {
namespace storage {

namespace fs = std::filesystem;

namespace {

const char* const TABLE_HEADER = "# aka alias table v1";

// Advisory lock held for the lifetime of the object
class FileLock {
public:
    FileLock(const std::string& path, bool exclusive) {
#ifdef __unix__
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ < 0) {
            throw core::StorageFailure("cannot open lock file " + path + ": " + std::strerror(errno));
        }
        int rc;
        do {
            rc = ::flock(fd_, exclusive ? LOCK_EX : LOCK_SH);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0) {
            int err = errno;
            ::close(fd_);
            fd_ = -1;
            throw core::StorageFailure("cannot lock " + path + ": " + std::strerror(err));
        }
#else
        (void)path;
        (void)exclusive;
#endif
    }

    ~FileLock() {
#ifdef __unix__
        if (fd_ >= 0) {
            ::flock(fd_, LOCK_UN);
            ::close(fd_);
        }
#endif
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

std::map<std::string, std::string> loadTable(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return {};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw core::StorageFailure("cannot read " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parseTable(ss.str());
}

class SnapshotTransaction : public ReadTransaction {
public:
    explicit SnapshotTransaction(std::map<std::string, std::string> table)
        : table_(std::move(table)) {}

    std::optional<std::string> get(const std::string& key) const override {
        auto it = table_.find(key);
        if (it == table_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    Entries entries() const override {
        return Entries(table_.begin(), table_.end());
    }

private:
    std::map<std::string, std::string> table_;
};

// Works on a private copy of the table and hands it to persist() on commit
class TableWriteTransaction : public WriteTransaction {
public:
    explicit TableWriteTransaction(std::map<std::string, std::string> table)
        : table_(std::move(table)) {}

    std::optional<std::string> get(const std::string& key) const override {
        auto it = table_.find(key);
        if (it == table_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    Entries entries() const override {
        return Entries(table_.begin(), table_.end());
    }

    void insert(const std::string& key, const std::string& value) override {
        table_[key] = value;
    }

    std::optional<std::string> remove(const std::string& key) override {
        auto it = table_.find(key);
        if (it == table_.end()) {
            return std::nullopt;
        }
        std::string previous = std::move(it->second);
        table_.erase(it);
        return previous;
    }

    void commit() override {
        if (committed_) {
            throw core::StorageFailure("transaction already committed");
        }
        persist(table_);
        committed_ = true;
    }

protected:
    virtual void persist(const std::map<std::string, std::string>& table) = 0;

private:
    std::map<std::string, std::string> table_;
    bool committed_ = false;
};

class FileWriteTransaction : public TableWriteTransaction {
public:
    FileWriteTransaction(std::unique_ptr<FileLock> lock, const std::string& path)
        : TableWriteTransaction(loadTable(path)), lock_(std::move(lock)), path_(path) {}

protected:
    void persist(const std::map<std::string, std::string>& table) override {
        std::string tmp = path_ + ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                throw core::StorageFailure("cannot write " + tmp);
            }
#ifdef __unix__
            ::chmod(tmp.c_str(), 0600);
#endif
            out << serializeTable(table);
            out.flush();
            if (!out) {
                out.close();
                std::error_code ignored;
                fs::remove(tmp, ignored);
                throw core::StorageFailure("cannot write " + tmp);
            }
        }

        // Data must be on disk before the rename makes it the table
        if (!syncPath(tmp, false)) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw core::StorageFailure("cannot sync " + tmp);
        }

        std::error_code ec;
        fs::rename(tmp, path_, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw core::StorageFailure("cannot replace " + path_ + ": " + ec.message());
        }

        // Some filesystems refuse directory fsync; the table is replaced either way
        fs::path parent = fs::path(path_).parent_path();
        (void)syncPath(parent.empty() ? std::string(".") : parent.string(), true);
    }

private:
    std::unique_ptr<FileLock> lock_;
    std::string path_;
};

class MemoryWriteTransaction : public TableWriteTransaction {
public:
    explicit MemoryWriteTransaction(std::map<std::string, std::string>& target)
        : TableWriteTransaction(target), target_(target) {}

protected:
    void persist(const std::map<std::string, std::string>& table) override {
        target_ = table;
    }

private:
    std::map<std::string, std::string>& target_;
};

} // namespace

// Table file format: header line, then base64(key) TAB base64(value) per entry
std::map<std::string, std::string> parseTable(const std::string& data) {
    std::map<std::string, std::string> table;
    std::istringstream lines(data);
    std::string line;
    size_t lineNo = 0;
    while (std::getline(lines, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto tab = line.find('\t');
        if (tab == std::string::npos) {
            throw core::StorageFailure("corrupt table at line " + std::to_string(lineNo));
        }
        table[base64Decode(line.substr(0, tab))] = base64Decode(line.substr(tab + 1));
    }
    return table;
}

std::string serializeTable(const std::map<std::string, std::string>& table) {
    std::string out = TABLE_HEADER;
    out += "\n";
    for (const auto& [key, value] : table) {
        out += base64Encode(key) + "\t" + base64Encode(value) + "\n";
    }
    return out;
}

bool syncPath(const std::string& path, bool directory) {
#ifdef __unix__
    int fd = ::open(path.c_str(), (directory ? O_RDONLY : O_WRONLY) | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    bool synced = ::fsync(fd) == 0;
    ::close(fd);
    return synced;
#else
    (void)path;
    (void)directory;
    return true;
#endif
}

FileDatabase::FileDatabase(const std::string& path)
    : path_(path), lockPath_(path + ".lock") {
    std::error_code ec;
    if (fs::is_directory(path_, ec)) {
        throw core::StorageFailure("cannot open " + path_ + ": is a directory");
    }
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw core::StorageFailure("cannot create " + parent.string() + ": " + ec.message());
        }
    }
    // Fails early when the directory is not writable
    FileLock check(lockPath_, false);
}

std::unique_ptr<ReadTransaction> FileDatabase::beginRead() {
    FileLock lock(lockPath_, false);
    return std::make_unique<SnapshotTransaction>(loadTable(path_));
}

std::unique_ptr<WriteTransaction> FileDatabase::beginWrite() {
    auto lock = std::make_unique<FileLock>(lockPath_, true);
    return std::make_unique<FileWriteTransaction>(std::move(lock), path_);
}

std::unique_ptr<ReadTransaction> MemoryDatabase::beginRead() {
    return std::make_unique<SnapshotTransaction>(table_);
}

std::unique_ptr<WriteTransaction> MemoryDatabase::beginWrite() {
    return std::make_unique<MemoryWriteTransaction>(table_);
}

} // namespace storage
} // namespace aka
