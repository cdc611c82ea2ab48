#pragma once

#include <stdexcept>
#include <string>

namespace aka {
namespace core {

// Base class for every failure the tool reports to the user
class AkaError : public std::runtime_error {
public:
    explicit AkaError(const std::string& msg) : std::runtime_error(msg) {}
};

// The persistence layer could not open, begin or commit a transaction
class StorageFailure : public AkaError {
public:
    explicit StorageFailure(const std::string& detail);
};

class AliasNotFound : public AkaError {
public:
    explicit AliasNotFound(const std::string& alias);

    const std::string& alias() const { return alias_; }

private:
    std::string alias_;
};

class ScopeNotFound : public AkaError {
public:
    ScopeNotFound(const std::string& alias, const std::string& scope);
};

// A directory given as scope cannot be resolved to an existing absolute path
class InvalidScope : public AkaError {
public:
    explicit InvalidScope(const std::string& path);
};

class OperationCancelled : public AkaError {
public:
    OperationCancelled();
};

class ConfigError : public AkaError {
public:
    explicit ConfigError(const std::string& detail);
};

// Malformed command line: unknown flag, missing argument, invalid alias name
class UsageError : public AkaError {
public:
    explicit UsageError(const std::string& msg) : AkaError(msg) {}
};

} // namespace core
} // namespace aka
