#include "shell/generator.hpp"
#include "core/config.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace aka {
namespace shell {

const std::string FUNCTIONS_MARKER = "__AKA_FUNCTIONS";

namespace {

const char* const BODY_INDENT = "    ";
const char* const BRANCH_INDENT = "        ";
const char* const FORWARD_ARGS = " \"$@\"";

// bash and zsh reserved words; a function of this name is a syntax error
const char* const RESERVED_WORDS[] = {
    "!", "{", "}", "[[", "]]", "if", "then", "else", "elif", "fi", "case", "esac",
    "for", "select", "while", "until", "do", "done", "in", "function", "time",
    "coproc", "foreach", "end", "repeat", "nocorrect"
};

enum class ScanState {
    Normal,
    SingleQuoted,
    DoubleQuoted,
    Escaped
};

// Progress of the if/elif/else chain inside one function
enum class BranchState {
    NoBranch,
    InChain,
    Closed
};

bool isParameterChar(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || c == '@' || c == '*' || c == '#';
}

// Peeks from the '{' at `open` to the matching '}' without moving the scan.
// "${1}", "${@}", "${#}" count; "${name}", "${1foo}" and "${}" do not.
bool bracedParameter(const std::string& text, size_t open) {
    bool sawParameter = false;
    for (size_t i = open + 1; i < text.size(); ++i) {
        char c = text[i];
        if (c == '}') {
            return sawParameter;
        }
        if (!isParameterChar(c)) {
            return false;
        }
        sawParameter = true;
    }
    return false;
}

std::string testFor(const storage::Scope& scope) {
    if (scope.kind == storage::Scope::Kind::Recursive) {
        return "[[ \"$current_dir\" == " + doubleQuote(scope.path) + "* ]]";
    }
    return "[[ \"$current_dir\" == " + doubleQuote(scope.path) + " ]]";
}

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' ||
           c == ':' || c == '+' || c == '-';
}

// End of the first word of a simple command
size_t firstWordEnd(const std::string& command, size_t start) {
    size_t end = start;
    while (end < command.size() &&
           std::string(" \t\n;|&<>()").find(command[end]) == std::string::npos) {
        ++end;
    }
    return end;
}

} // namespace

bool isValidFunctionName(const std::string& name) {
    if (name.empty() || name[0] == '-') {
        return false;
    }
    if (!std::all_of(name.begin(), name.end(), isNameChar)) {
        return false;
    }
    for (const char* word : RESERVED_WORDS) {
        if (name == word) {
            return false;
        }
    }
    return true;
}

std::string guardSelfCall(const std::string& name, const std::string& command) {
    size_t start = command.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return command;
    }
    size_t end = firstWordEnd(command, start);
    if (command.compare(start, end - start, name) != 0) {
        return command;
    }
    return command.substr(0, start) + "command " + command.substr(start);
}

std::string doubleQuote(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '\\' || c == '"' || c == '$' || c == '`') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string replacePlaceholders(const std::string& command) {
    std::string out = command;
    for (size_t i = 0; i + 1 < out.size(); ++i) {
        if (out[i] == '@' && std::isdigit(static_cast<unsigned char>(out[i + 1]))) {
            out[i] = '$';
        }
    }
    return out;
}

bool hasPositionalArgs(const std::string& command) {
    ScanState state = ScanState::Normal;
    ScanState resume = ScanState::Normal;

    for (size_t i = 0; i < command.size(); ++i) {
        char c = command[i];

        switch (state) {
        case ScanState::Escaped:
            state = resume;
            continue;
        case ScanState::SingleQuoted:
            if (c == '\'') {
                state = ScanState::Normal;
            }
            continue;
        case ScanState::Normal:
            if (c == '\\') {
                resume = ScanState::Normal;
                state = ScanState::Escaped;
                continue;
            }
            if (c == '\'') {
                state = ScanState::SingleQuoted;
                continue;
            }
            if (c == '"') {
                state = ScanState::DoubleQuoted;
                continue;
            }
            break;
        case ScanState::DoubleQuoted:
            if (c == '\\') {
                resume = ScanState::DoubleQuoted;
                state = ScanState::Escaped;
                continue;
            }
            if (c == '"') {
                state = ScanState::Normal;
                continue;
            }
            break;
        }

        if (c != '$' || i + 1 >= command.size()) {
            continue;
        }
        char next = command[i + 1];
        if (isParameterChar(next)) {
            return true;
        }
        if (next == '{' && bracedParameter(command, i + 1)) {
            return true;
        }
    }
    return false;
}

std::string renderCommand(const std::string& command) {
    std::string body = replacePlaceholders(command);
    if (!hasPositionalArgs(body)) {
        body += FORWARD_ARGS;
    }
    return body;
}

storage::DefinitionList sortByPrecedence(storage::DefinitionList definitions) {
    std::stable_sort(definitions.begin(), definitions.end(),
                     [](const storage::Definition& a, const storage::Definition& b) {
                         return storage::precedes(a.scope, b.scope);
                     });
    return definitions;
}

std::string renderFunction(const std::string& name, const storage::DefinitionList& definitions) {
    // Precedence puts every Global definition after the scoped ones
    storage::DefinitionList ordered = sortByPrecedence(definitions);

    std::ostringstream out;
    out << "unalias " << name << " 2>/dev/null\n";
    out << "unset -f " << name << " 2>/dev/null\n";
    out << name << "() {\n";

    BranchState state = BranchState::NoBranch;
    for (const auto& def : ordered) {
        if (state == BranchState::Closed) {
            break;
        }
        if (def.scope.isGlobal()) {
            if (state == BranchState::NoBranch) {
                // Only a global definition: no conditional wrapper
                out << BODY_INDENT << renderCommand(guardSelfCall(name, def.command)) << "\n";
            } else {
                out << BODY_INDENT << "else\n";
                out << BRANCH_INDENT << renderCommand(guardSelfCall(name, def.command)) << "\n";
                out << BODY_INDENT << "fi\n";
            }
            state = BranchState::Closed;
            continue;
        }
        if (state == BranchState::NoBranch) {
            out << BODY_INDENT << "local current_dir=\"$PWD\"\n";
            out << BODY_INDENT << "if " << testFor(def.scope) << "; then\n";
            state = BranchState::InChain;
        } else {
            out << BODY_INDENT << "elif " << testFor(def.scope) << "; then\n";
        }
        out << BRANCH_INDENT << renderCommand(guardSelfCall(name, def.command)) << "\n";
    }

    if (state == BranchState::InChain) {
        // Outside its directories the alias must not shadow the real program
        out << BODY_INDENT << "else\n";
        out << BRANCH_INDENT << "command " << name << FORWARD_ARGS << "\n";
        out << BODY_INDENT << "fi\n";
    }

    out << "}\n";
    return out.str();
}

std::string renderDump(const storage::AliasMap& aliases) {
    std::ostringstream out;
    out << "# Generated by aka. Do not edit.\n";

    // Suspend alias expansion so "name() {" is never rewritten by an alias
    out << "__aka_saved_aliases=\n";
    out << "if [ -n \"$ZSH_VERSION\" ]; then\n";
    out << "    if [[ -o aliases ]]; then\n";
    out << "        __aka_saved_aliases=zsh\n";
    out << "        unsetopt aliases\n";
    out << "    fi\n";
    out << "elif [ -n \"$BASH_VERSION\" ]; then\n";
    out << "    if shopt -q expand_aliases; then\n";
    out << "        __aka_saved_aliases=bash\n";
    out << "        shopt -u expand_aliases\n";
    out << "    fi\n";
    out << "fi\n";

    // Functions from the previous dump that may since have been removed
    out << "for __aka_fn in $(printf '%s' \"$" << FUNCTIONS_MARKER << "\"); do\n";
    out << "    unset -f \"$__aka_fn\" 2>/dev/null\n";
    out << "done\n";

    std::string names;
    for (const auto& [name, definitions] : aliases) {
        // A bad name would abort the whole eval, so older records with one are left out
        if (definitions.empty() || !isValidFunctionName(name)) {
            continue;
        }
        out << renderFunction(name, definitions);
        if (!names.empty()) names += " ";
        names += name;
    }

    out << FUNCTIONS_MARKER << "=" << core::shellQuote(names) << "\n";
    out << "case \"$__aka_saved_aliases\" in\n";
    out << "    zsh) setopt aliases ;;\n";
    out << "    bash) shopt -s expand_aliases ;;\n";
    out << "esac\n";
    out << "unset __aka_saved_aliases __aka_fn\n";
    return out.str();
}

std::string renderBootstrap(const std::string& executable) {
    std::ostringstream out;
    out << "# aka shell integration\n";
    out << "# Add to ~/.zshrc or ~/.bashrc: eval \"$(aka init)\"\n";
    out << "__aka_bin=" << core::shellQuote(executable) << "\n\n";

    out << "__aka_reload() {\n";
    out << "    eval \"$(\"$__aka_bin\" init --dump)\"\n";
    out << "}\n\n";

    out << "aka() {\n";
    out << "    \"$__aka_bin\" \"$@\"\n";
    out << "    local __aka_status=$?\n";
    out << "    __aka_reload\n";
    out << "    return $__aka_status\n";
    out << "}\n\n";

    out << "# zsh: precmd hook; bash: PROMPT_COMMAND\n";
    out << "if [ -n \"$ZSH_VERSION\" ]; then\n";
    out << "    autoload -Uz add-zsh-hook 2>/dev/null || true\n";
    out << "    add-zsh-hook precmd __aka_reload\n";
    out << "elif [ -n \"$BASH_VERSION\" ]; then\n";
    out << "    case \";${PROMPT_COMMAND:-};\" in\n";
    out << "        *\";__aka_reload;\"*) ;;\n";
    out << "        *) PROMPT_COMMAND=\"__aka_reload${PROMPT_COMMAND:+;$PROMPT_COMMAND}\" ;;\n";
    out << "    esac\n";
    out << "else\n";
    out << "    # Other shells have no prompt hook: aliases refresh at startup and\n";
    out << "    # after every aka call only.\n";
    out << "    :\n";
    out << "fi\n\n";

    out << "__aka_reload\n";
    return out.str();
}

} // namespace shell
} // namespace aka
