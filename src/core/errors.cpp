#include "core/errors.hpp"

namespace aka {
namespace core {

StorageFailure::StorageFailure(const std::string& detail)
    : AkaError("Storage error: " + detail) {}

AliasNotFound::AliasNotFound(const std::string& alias)
    : AkaError("Alias not found: " + alias), alias_(alias) {}

ScopeNotFound::ScopeNotFound(const std::string& alias, const std::string& scope)
    : AkaError("No definition found for alias '" + alias + "' in scope '" + scope + "'") {}

InvalidScope::InvalidScope(const std::string& path)
    : AkaError("Invalid scope path: " + path) {}

OperationCancelled::OperationCancelled()
    : AkaError("Operation cancelled") {}

ConfigError::ConfigError(const std::string& detail)
    : AkaError("Configuration error: " + detail) {}

} // namespace core
} // namespace aka
