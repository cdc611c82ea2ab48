#include "gtest/gtest.h"
#include "storage/codec.hpp"

using namespace aka::storage;

TEST(EncodeDefinitionsFunction, GlobalDefinition) {
    DefinitionList defs = {{"echo bar", Scope::global()}};
    ASSERT_EQ(encodeDefinitions(defs), R"([{"command":"echo bar","scope":"Global"}])");
}

TEST(EncodeDefinitionsFunction, ScopedDefinitions) {
    DefinitionList defs = {
        {"make", Scope::exact("/src")},
        {"npm test", Scope::recursive("/work")},
    };
    ASSERT_EQ(encodeDefinitions(defs),
              R"([{"command":"make","scope":{"Exact":"/src"}},)"
              R"({"command":"npm test","scope":{"Recursive":"/work"}}])");
}

TEST(EncodeDefinitionsFunction, EscapesQuotesAndControlCharacters) {
    DefinitionList defs = {{"echo \"hi\"\tthere\\", Scope::global()}};
    ASSERT_EQ(encodeDefinitions(defs),
              R"([{"command":"echo \"hi\"\tthere\\","scope":"Global"}])");
}

TEST(DecodeDefinitionsFunction, ReadsWhatEncodeWrites) {
    DefinitionList defs = {
        {"git status", Scope::global()},
        {"awk '{print $1}'", Scope::exact("/a b/c")},
        {"echo \"@1\"\n", Scope::recursive("/r")},
    };
    auto decoded = decodeDefinitions(encodeDefinitions(defs));
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(*decoded, defs);
}

TEST(DecodeDefinitionsFunction, ReadsBackRawUtf8) {
    DefinitionList defs = {
        {"echo \xC3\xA9 \xF0\x9F\x98\x80", Scope::global()},
        {"ls", Scope::exact("/tmp/\xE6\x97\xA5\xE6\x9C\xAC")},
        {"cat caf\xC3\xA9.txt", Scope::recursive("/srv/\xC3\xBC")},
    };
    std::string encoded = encodeDefinitions(defs);
    // Multibyte text is stored as is, not as \u escapes
    ASSERT_NE(encoded.find("\xF0\x9F\x98\x80"), std::string::npos);

    auto decoded = decodeDefinitions(encoded);
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(*decoded, defs);
}

TEST(DecodeDefinitionsFunction, ReadsBackBytesThatAreNotUtf8) {
    DefinitionList defs = {
        {"printf '\xFF\x7F\x80'", Scope::exact("/tmp/\xFE")},
    };
    auto decoded = decodeDefinitions(encodeDefinitions(defs));
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(*decoded, defs);
}

TEST(DecodeDefinitionsFunction, ToleratesWhitespaceAndKeyOrder) {
    auto decoded = decodeDefinitions(
        " [ { \"scope\" : { \"Exact\" : \"/x\" } , \"command\" : \"ls\" } ] \n");
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->size(), 1u);
    ASSERT_EQ((*decoded)[0].command, "ls");
    ASSERT_EQ((*decoded)[0].scope, Scope::exact("/x"));
}

TEST(DecodeDefinitionsFunction, DecodesUnicodeEscapes) {
    auto decoded = decodeDefinitions(R"([{"command":"echo \u00e9 \ud83d\ude00","scope":"Global"}])");
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ((*decoded)[0].command, "echo \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(DecodeDefinitionsFunction, RejectsMalformedInput) {
    ASSERT_FALSE(decodeDefinitions("").has_value());
    ASSERT_FALSE(decodeDefinitions("ls -la").has_value());
    ASSERT_FALSE(decodeDefinitions(R"([{"command":"ls"}])").has_value());
    ASSERT_FALSE(decodeDefinitions(R"([{"command":"ls","scope":"Local"}])").has_value());
    ASSERT_FALSE(decodeDefinitions(R"([{"command":"ls","scope":{"Parent":"/x"}}])").has_value());
    ASSERT_FALSE(decodeDefinitions(R"([{"command":"ls","scope":"Global","extra":1}])").has_value());
    ASSERT_FALSE(decodeDefinitions(R"([{"command":"ls","scope":"Global"}] trailing)").has_value());
    ASSERT_FALSE(decodeDefinitions(R"([{"command":"ls","scope":"Global"})").has_value());
    ASSERT_FALSE(decodeDefinitions(R"([{"command":"\ud83d","scope":"Global"}])").has_value());
}

TEST(DecodeDefinitionsFunction, EmptyListIsValid) {
    auto decoded = decodeDefinitions("[]");
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(decoded->empty());
}

TEST(DecodeStoredValueFunction, LegacyRawCommandBecomesGlobal) {
    DefinitionList defs = decodeStoredValue("ls -la --color");
    ASSERT_EQ(defs.size(), 1u);
    ASSERT_EQ(defs[0].command, "ls -la --color");
    ASSERT_TRUE(defs[0].scope.isGlobal());
}

TEST(DecodeStoredValueFunction, EmptyListIsTreatedAsRawCommand) {
    DefinitionList defs = decodeStoredValue("[]");
    ASSERT_EQ(defs.size(), 1u);
    ASSERT_EQ(defs[0].command, "[]");
    ASSERT_TRUE(defs[0].scope.isGlobal());
}

TEST(DecodeStoredValueFunction, SerializedListIsDecoded) {
    DefinitionList defs = decodeStoredValue(R"([{"command":"make","scope":{"Recursive":"/p"}}])");
    ASSERT_EQ(defs.size(), 1u);
    ASSERT_EQ(defs[0].scope, Scope::recursive("/p"));
}

TEST(Base64Functions, KnownVectors) {
    ASSERT_EQ(base64Encode(""), "");
    ASSERT_EQ(base64Encode("f"), "Zg==");
    ASSERT_EQ(base64Encode("fo"), "Zm8=");
    ASSERT_EQ(base64Encode("foo"), "Zm9v");
    ASSERT_EQ(base64Encode("foobar"), "Zm9vYmFy");
    ASSERT_EQ(base64Decode("Zm9vYmFy"), "foobar");
    ASSERT_EQ(base64Decode("Zg=="), "f");
}

TEST(Base64Functions, BinarySafe) {
    std::string bytes("a\0b\n\tc\xff", 7);
    ASSERT_EQ(base64Decode(base64Encode(bytes)), bytes);
}
