#pragma once

#include "storage/scope.hpp"
#include <optional>
#include <string>

namespace aka {
namespace storage {

// Definition list <-> JSON text, e.g.
//   [{"command":"ls","scope":"Global"},{"command":"make","scope":{"Exact":"/src"}}]
std::string encodeDefinitions(const DefinitionList& definitions);
std::optional<DefinitionList> decodeDefinitions(const std::string& text);

// Decodes a value read from the table. Anything that is not a non-empty
// serialized list is an older single-command value and becomes one Global
// definition.
DefinitionList decodeStoredValue(const std::string& value);

// JSON string literal including the surrounding quotes
std::string jsonQuote(const std::string& str);

// Base64 encoding/decoding
std::string base64Encode(const std::string& input);
std::string base64Decode(const std::string& input);

} // namespace storage
} // namespace aka
