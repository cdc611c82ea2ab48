#include "history/history.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "system/system.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <istream>
#include <ostream>
#include <sstream>
#include <unordered_set>
#ifdef __unix__
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace aka {
namespace history {

namespace fs = std::filesystem;

namespace {

const char* const REPLACEMENT_CHAR = "\xEF\xBF\xBD";

// Candidate list handed to the selector on stdin, removed on scope exit
class TempFile {
public:
    explicit TempFile(const std::string& content) {
        std::string pattern = (fs::temp_directory_path() / "aka-history-XXXXXX").string();
#ifdef __unix__
        int fd = ::mkstemp(pattern.data());
        if (fd < 0) {
            throw core::ConfigError("cannot create temporary file");
        }
        ::close(fd);
#endif
        path_ = pattern;
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw core::ConfigError("cannot write " + path_);
        }
        out << content;
    }

    ~TempFile() {
        std::error_code ignored;
        fs::remove(path_, ignored);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the well-formed sequence starting at i, 0 when malformed
size_t sequenceLength(const std::string& s, size_t i) {
    unsigned char lead = static_cast<unsigned char>(s[i]);
    size_t len;
    unsigned char lo = 0x80, hi = 0xBF;

    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }

    if (i + len > s.size()) return 0;
    unsigned char second = static_cast<unsigned char>(s[i + 1]);
    if (second < lo || second > hi) return 0;
    for (size_t k = 2; k < len; ++k) {
        if (!isContinuation(static_cast<unsigned char>(s[i + k]))) return 0;
    }
    return len;
}

bool isBashTimestamp(const std::string& line) {
    return line.size() > 1 && line[0] == '#' &&
           std::all_of(line.begin() + 1, line.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

std::string sanitizeUtf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (size_t i = 0; i < bytes.size();) {
        size_t len = sequenceLength(bytes, i);
        if (len == 0) {
            out += REPLACEMENT_CHAR;
            ++i;
        } else {
            out.append(bytes, i, len);
            i += len;
        }
    }
    return out;
}

std::string resolveHistoryPath(const core::Config& cfg) {
    if (!core::trim(cfg.historyFile).empty()) {
        return cfg.historyFile;
    }

    std::string histfile = core::getenvs("HISTFILE");
    if (!core::trim(histfile).empty()) {
        return histfile;
    }

    std::string home = core::getenvs("HOME");
    if (home.empty()) {
        throw core::ConfigError("Could not find home directory");
    }

    std::error_code ec;
    for (const char* name : {".zsh_history", ".bash_history"}) {
        fs::path candidate = fs::path(home) / name;
        if (fs::exists(candidate, ec)) {
            return candidate.string();
        }
    }

    throw core::ConfigError("History file not found. Set HISTFILE or AKA_HISTORY_FILE");
}

std::optional<std::string> parseHistoryLine(const std::string& line) {
    // zsh extended history: ": <start>:<elapsed>;<command>"
    if (line.rfind(": ", 0) == 0) {
        auto semi = line.find(';');
        if (semi != std::string::npos) {
            return line.substr(semi + 1);
        }
    }

    if (isBashTimestamp(line)) {
        return std::nullopt;
    }
    return line;
}

std::vector<std::string> readHistoryEntries(const std::string& path, size_t limit) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw core::ConfigError("cannot read history file " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    std::vector<std::string> lines;
    std::istringstream content(sanitizeUtf8(ss.str()));
    std::string line;
    while (std::getline(content, line)) {
        lines.push_back(line);
    }

    size_t maxEntries = limit == 0 ? DEFAULT_HISTORY_LIMIT : limit;
    std::vector<std::string> entries;
    std::unordered_set<std::string> seen;

    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        auto command = parseHistoryLine(*it);
        if (!command) {
            continue;
        }
        std::string trimmed = core::trim(*command);
        if (trimmed.empty() || !seen.insert(trimmed).second) {
            continue;
        }
        entries.push_back(trimmed);
        if (entries.size() >= maxEntries) {
            break;
        }
    }
    return entries;
}

std::string selectEntry(const core::Config& cfg, const std::vector<std::string>& entries) {
    if (entries.empty()) {
        throw core::OperationCancelled();
    }
    if (!core::commandExists(cfg.fzfBinary)) {
        throw core::ConfigError("fzf not found: " + cfg.fzfBinary);
    }

    std::string candidates;
    for (const auto& entry : entries) {
        candidates += entry + "\n";
    }
    TempFile input(candidates);

    std::string cmd = core::shellQuote(cfg.fzfBinary) +
                      " --exit-0 --reverse --height=40% " +
                      core::shellQuote("--prompt=aka> ") +
                      " < " + core::shellQuote(input.path());

    int status = 0;
    std::string selected = core::trim(system::runCmdCapture(cmd, &status));
#ifdef __unix__
    bool succeeded = status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
#else
    bool succeeded = status == 0;
#endif
    if (!succeeded || selected.empty()) {
        throw core::OperationCancelled();
    }
    return selected;
}

std::string promptAliasName(const std::string& command, std::istream& in, std::ostream& out) {
    std::string line;
    while (true) {
        out << "Alias name (command: " << command << "): ";
        out.flush();
        if (!std::getline(in, line)) {
            throw core::OperationCancelled();
        }
        std::string name = core::trim(line);
        if (!name.empty()) {
            return name;
        }
    }
}

} // namespace history
} // namespace aka
