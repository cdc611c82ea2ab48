#include "storage/codec.hpp"
#include <cstdio>
#include <cstdint>

namespace aka {
namespace storage {

namespace {

const char* const KEY_COMMAND = "command";
const char* const KEY_SCOPE = "scope";
const char* const SCOPE_GLOBAL = "Global";
const char* const SCOPE_EXACT = "Exact";
const char* const SCOPE_RECURSIVE = "Recursive";

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Minimal reader for the definition list grammar. Every parse method returns
// false on malformed input and leaves the caller to discard the result.
class ListReader {
public:
    explicit ListReader(const std::string& text) : text_(text) {}

    bool readList(DefinitionList& out) {
        skipWhitespace();
        if (!consume('[')) {
            return false;
        }
        skipWhitespace();
        if (consume(']')) {
            return atEnd();
        }
        while (true) {
            Definition def;
            if (!readDefinition(def)) {
                return false;
            }
            out.push_back(def);
            skipWhitespace();
            if (consume(',')) {
                continue;
            }
            if (consume(']')) {
                return atEnd();
            }
            return false;
        }
    }

private:
    bool readDefinition(Definition& def) {
        skipWhitespace();
        if (!consume('{')) {
            return false;
        }
        bool haveCommand = false;
        bool haveScope = false;
        while (true) {
            std::string key;
            skipWhitespace();
            if (!readString(key)) {
                return false;
            }
            skipWhitespace();
            if (!consume(':')) {
                return false;
            }
            skipWhitespace();
            if (key == KEY_COMMAND && !haveCommand) {
                if (!readString(def.command)) {
                    return false;
                }
                haveCommand = true;
            } else if (key == KEY_SCOPE && !haveScope) {
                if (!readScope(def.scope)) {
                    return false;
                }
                haveScope = true;
            } else {
                return false;
            }
            skipWhitespace();
            if (consume(',')) {
                continue;
            }
            if (consume('}')) {
                return haveCommand && haveScope;
            }
            return false;
        }
    }

    bool readScope(Scope& scope) {
        if (peek() == '"') {
            std::string tag;
            if (!readString(tag) || tag != SCOPE_GLOBAL) {
                return false;
            }
            scope = Scope::global();
            return true;
        }
        if (!consume('{')) {
            return false;
        }
        std::string tag;
        std::string path;
        skipWhitespace();
        if (!readString(tag)) {
            return false;
        }
        skipWhitespace();
        if (!consume(':')) {
            return false;
        }
        skipWhitespace();
        if (!readString(path)) {
            return false;
        }
        skipWhitespace();
        if (!consume('}')) {
            return false;
        }
        if (tag == SCOPE_EXACT) {
            scope = Scope::exact(path);
        } else if (tag == SCOPE_RECURSIVE) {
            scope = Scope::recursive(path);
        } else {
            return false;
        }
        return true;
    }

    bool readString(std::string& out) {
        if (!consume('"')) {
            return false;
        }
        out.clear();
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return true;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return false;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) {
                return false;
            }
            char esc = text_[pos_++];
            switch (esc) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                uint32_t cp = 0;
                if (!readHex4(cp)) {
                    return false;
                }
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    uint32_t low = 0;
                    if (!consume('\\') || !consume('u') || !readHex4(low) ||
                        low < 0xDC00 || low > 0xDFFF) {
                        return false;
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    return false;
                }
                appendUtf8(out, cp);
                break;
            }
            default:
                return false;
            }
        }
        return false;
    }

    bool readHex4(uint32_t& value) {
        if (pos_ + 4 > text_.size()) {
            return false;
        }
        value = 0;
        for (int i = 0; i < 4; ++i) {
            char c = text_[pos_++];
            value <<= 4;
            if (c >= '0' && c <= '9') {
                value |= static_cast<uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                value |= static_cast<uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                value |= static_cast<uint32_t>(c - 'A' + 10);
            } else {
                return false;
            }
        }
        return true;
    }

    void skipWhitespace() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool atEnd() {
        skipWhitespace();
        return pos_ == text_.size();
    }

    char peek() const {
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    bool consume(char expected) {
        if (pos_ < text_.size() && text_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    const std::string& text_;
    size_t pos_ = 0;
};

std::string encodeScope(const Scope& scope) {
    switch (scope.kind) {
    case Scope::Kind::Global:
        return jsonQuote(SCOPE_GLOBAL);
    case Scope::Kind::Exact:
        return "{" + jsonQuote(SCOPE_EXACT) + ":" + jsonQuote(scope.path) + "}";
    case Scope::Kind::Recursive:
        return "{" + jsonQuote(SCOPE_RECURSIVE) + ":" + jsonQuote(scope.path) + "}";
    }
    return jsonQuote(SCOPE_GLOBAL);
}

} // namespace

std::string jsonQuote(const std::string& str) {
    std::string out;
    out.reserve(str.size() + 2);
    out.push_back('"');
    for (char c : str) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                out += buf;
            } else {
                out.push_back(c);
            }
        }
    }
    out.push_back('"');
    return out;
}

std::string encodeDefinitions(const DefinitionList& definitions) {
    std::string out = "[";
    bool first = true;
    for (const auto& def : definitions) {
        if (!first) out += ",";
        first = false;
        out += "{" + jsonQuote(KEY_COMMAND) + ":" + jsonQuote(def.command) + "," +
               jsonQuote(KEY_SCOPE) + ":" + encodeScope(def.scope) + "}";
    }
    out += "]";
    return out;
}

std::optional<DefinitionList> decodeDefinitions(const std::string& text) {
    DefinitionList definitions;
    ListReader reader(text);
    if (!reader.readList(definitions)) {
        return std::nullopt;
    }
    return definitions;
}

DefinitionList decodeStoredValue(const std::string& value) {
    auto decoded = decodeDefinitions(value);
    // An empty list is never written, so "[]" can only be a raw command
    if (decoded && !decoded->empty()) {
        return *decoded;
    }
    return {Definition{value, Scope::global()}};
}

// Base64 encoding
std::string base64Encode(const std::string& input) {
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    unsigned char a3[3];
    for (size_t pos = 0; pos < input.size();) {
        int len = 0;
        for (; len < 3 && pos < input.size(); ++len) {
            a3[len] = static_cast<unsigned char>(input[pos++]);
        }
        for (int j = len; j < 3; ++j) {
            a3[j] = 0;
        }

        unsigned int triple = (a3[0] << 16) | (a3[1] << 8) | a3[2];
        output.push_back(table[(triple >> 18) & 0x3F]);
        output.push_back(table[(triple >> 12) & 0x3F]);
        output.push_back(len >= 2 ? table[(triple >> 6) & 0x3F] : '=');
        output.push_back(len >= 3 ? table[triple & 0x3F] : '=');
    }

    return output;
}

// Base64 decoding
std::string base64Decode(const std::string& input) {
    auto val = [](char c) -> int {
        if ('A' <= c && c <= 'Z') return c - 'A';
        if ('a' <= c && c <= 'z') return c - 'a' + 26;
        if ('0' <= c && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    std::string output;
    output.reserve((input.size() / 4) * 3);

    int accum = 0, bits = 0;
    for (char c : input) {
        if (c == '=') break;
        int v = val(c);
        if (v < 0) continue;

        accum = ((accum << 6) | v) & 0xFFFFFF;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            output.push_back(static_cast<char>((accum >> bits) & 0xFF));
        }
    }

    return output;
}

} // namespace storage
} // namespace aka
