#include "cli/cli.hpp"
#include "ui/ui.hpp"
#include <iostream>
#include <vector>
#include <string>

namespace aka {
namespace cli {

// Flag expansion
std::vector<std::string> expandShortFlags(const std::vector<std::string>& args) {
    std::vector<std::string> expanded;
    expanded.reserve(args.size() * 2);

    bool afterSeparator = false;
    for (const auto& arg : args) {
        if (afterSeparator) {
            expanded.push_back(arg);
            continue;
        }
        if (arg == "--") {
            afterSeparator = true;
            expanded.push_back(arg);
            continue;
        }
        // "-" alone and negative numbers (--limit -1) pass through untouched
        bool shortCluster = arg.size() >= 2 && arg[0] == '-' && arg[1] != '-' &&
                            !(arg[1] >= '0' && arg[1] <= '9');
        if (!shortCluster) {
            expanded.push_back(arg);
            continue;
        }
        // -rs becomes --recursive --scope
        for (size_t i = 1; i < arg.size(); ++i) {
            char c = arg[i];
            if (c == 's') {
                expanded.push_back("--scope");
            } else if (c == 'r') {
                expanded.push_back("--recursive");
            } else if (c == 'a') {
                expanded.push_back("--all");
            } else if (c == 'f') {
                expanded.push_back("--force");
            } else if (c == 'n') {
                expanded.push_back("--limit");
            } else if (c == 'h') {
                expanded.push_back("--help");
            } else if (c == 'v') {
                expanded.push_back("--version");
            } else {
                // Unknown short flag, keep as is
                expanded.push_back(std::string("-") + c);
            }
        }
    }

    return expanded;
}

// Help system
void showTips() {
    std::cout << ui::colorize("Getting started:", ui::Colors::BRIGHT_YELLOW + ui::Colors::BOLD) << "\n";
    std::cout << ui::colorize("1. ", ui::Colors::BRIGHT_WHITE) << ui::colorize("Hook aka into your shell: ", ui::Colors::WHITE)
             << ui::colorize("aka install", ui::Colors::BRIGHT_CYAN) << ui::colorize(" (or add ", ui::Colors::DIM)
             << ui::colorize("eval \"$(aka init)\"", ui::Colors::DIM) << ui::colorize(" yourself)", ui::Colors::DIM) << "\n";
    std::cout << ui::colorize("2. ", ui::Colors::BRIGHT_WHITE) << ui::colorize("Add an alias everywhere: ", ui::Colors::WHITE)
             << ui::colorize("aka gs 'git status'", ui::Colors::BRIGHT_CYAN) << "\n";
    std::cout << ui::colorize("3. ", ui::Colors::BRIGHT_WHITE) << ui::colorize("Add one for this project only: ", ui::Colors::WHITE)
             << ui::colorize("aka add t 'make test' --scope --recursive", ui::Colors::BRIGHT_CYAN) << "\n";
    std::cout << ui::colorize("4. ", ui::Colors::BRIGHT_WHITE) << ui::colorize("Use @1, @2 for arguments: ", ui::Colors::WHITE)
             << ui::colorize("aka mkcd 'mkdir -p @1 && cd @1'", ui::Colors::BRIGHT_CYAN) << "\n";
    std::cout << ui::colorize("5. ", ui::Colors::BRIGHT_WHITE) << ui::colorize("Run ", ui::Colors::WHITE)
             << ui::colorize("aka help", ui::Colors::BRIGHT_MAGENTA) << ui::colorize(" for every command", ui::Colors::WHITE) << "\n\n";
}

void cmd_help() {
    std::cout << ui::colorize("aka", ui::Colors::BRIGHT_CYAN + ui::Colors::BOLD)
              << ui::colorize(" - scoped shell alias manager", ui::Colors::BRIGHT_WHITE) << "\n\n";

    std::cout << ui::colorize("USAGE:", ui::Colors::BRIGHT_WHITE + ui::Colors::BOLD) << "\n";
    std::cout << "  " << ui::colorize("aka", ui::Colors::BRIGHT_CYAN) << ui::colorize(" [command] [options] [arguments]", ui::Colors::WHITE) << "\n\n";

    std::cout << ui::colorize("SHORTCUTS:", ui::Colors::BRIGHT_GREEN + ui::Colors::BOLD) << "\n";
    std::cout << "  " << ui::colorize("aka", ui::Colors::BRIGHT_CYAN) << "                                 List aliases active in this directory\n";
    std::cout << "  " << ui::colorize("aka <name> <command>", ui::Colors::BRIGHT_CYAN) << "                Add a global alias\n";
    std::cout << "  " << ui::colorize("aka <name>", ui::Colors::BRIGHT_CYAN) << "                          Remove an alias\n\n";

    std::cout << ui::colorize("ALIASES:", ui::Colors::BRIGHT_BLUE + ui::Colors::BOLD) << "\n";
    std::cout << "  " << ui::colorize("aka add <name> <command> [--scope [DIR]] [--recursive]", ui::Colors::BRIGHT_CYAN) << "\n";
    std::cout << "                                      Add an alias, optionally limited to a directory\n";
    std::cout << "  " << ui::colorize("aka add [<name>] [--scope [DIR]] [--recursive] [--limit N]", ui::Colors::BRIGHT_CYAN) << "\n";
    std::cout << "                                      Pick the command from shell history with fzf\n";
    std::cout << "  " << ui::colorize("aka rm <name> [--scope DIR|global] [--recursive]", ui::Colors::BRIGHT_CYAN) << "\n";
    std::cout << "                                      Remove an alias or one of its scopes\n";
    std::cout << "  " << ui::colorize("aka rm --all [--scope DIR|global] [--force]", ui::Colors::BRIGHT_CYAN) << "\n";
    std::cout << "                                      Remove every alias (requires confirmation)\n";
    std::cout << "  " << ui::colorize("aka ls [--all] [--json]", ui::Colors::BRIGHT_CYAN) << "             List aliases (--all ignores the current directory)\n\n";

    std::cout << ui::colorize("SHELL:", ui::Colors::BRIGHT_MAGENTA + ui::Colors::BOLD) << "\n";
    std::cout << "  " << ui::colorize("aka init", ui::Colors::BRIGHT_CYAN) << "                            Print the shell hook for eval\n";
    std::cout << "  " << ui::colorize("aka init --dump", ui::Colors::BRIGHT_CYAN) << "                     Print the alias functions\n";
    std::cout << "  " << ui::colorize("aka install", ui::Colors::BRIGHT_CYAN) << "                         Add the hook to ~/.zshrc or ~/.bashrc\n";
    std::cout << "  " << ui::colorize("aka completion <bash|zsh>", ui::Colors::BRIGHT_CYAN) << "           Generate shell completion script\n\n";

    std::cout << ui::colorize("SYSTEM:", ui::Colors::BRIGHT_RED + ui::Colors::BOLD) << "\n";
    std::cout << "  " << ui::colorize("aka help", ui::Colors::BRIGHT_CYAN) << "                            Show this help message\n";
    std::cout << "  " << ui::colorize("aka version", ui::Colors::BRIGHT_CYAN) << "                         Show version information\n\n";

    std::cout << ui::colorize("OPTIONS:", ui::Colors::DIM + ui::Colors::BOLD) << "\n";
    std::cout << "  -s, --scope      -r, --recursive   -a, --all   -f, --force\n";
    std::cout << "  -n, --limit      --json            -h, --help  -v, --version\n\n";

    std::cout << ui::colorize("ENVIRONMENT:", ui::Colors::DIM + ui::Colors::BOLD) << "\n";
    std::cout << "  AKA_DATA_DIR       Base directory of the alias database\n";
    std::cout << "  AKA_HISTORY_FILE   History file used by 'aka add' without a command\n";
    std::cout << "  AKA_FZF_BIN        Selector binary (default: fzf)\n";
    std::cout << "  NO_COLOR           Disable colored output\n";
}

void showWelcome() {
    cmd_help();
    std::cout << "\n";
    showTips();
}

// Shell completion generation
void generateBashCompletion() {
    std::cout << R"(#!/bin/bash
# Bash completion for aka

_aka_completion() {
    local cur prev
    COMPREPLY=()
    cur="${COMP_WORDS[COMP_CWORD]}"
    prev="${COMP_WORDS[COMP_CWORD-1]}"

    local commands="add remove rm list ls init install completion version help"

    case "${prev}" in
        --scope|-s)
            COMPREPLY=($(compgen -d -- ${cur}) $(compgen -W "global" -- ${cur}))
            return 0
            ;;
        --limit|-n)
            return 0
            ;;
        completion)
            COMPREPLY=($(compgen -W "bash zsh" -- ${cur}))
            return 0
            ;;
    esac

    if [ ${COMP_CWORD} -eq 1 ]; then
        local aliases=$(aka list --all 2>/dev/null | awk '{print $1}')
        COMPREPLY=($(compgen -W "${commands} ${aliases} --help --version --json" -- ${cur}))
        return 0
    fi

    case "${COMP_WORDS[1]}" in
        add)
            COMPREPLY=($(compgen -W "--scope --recursive --limit" -- ${cur}))
            ;;
        remove|rm)
            local aliases=$(aka list --all 2>/dev/null | awk '{print $1}')
            COMPREPLY=($(compgen -W "${aliases} --scope --recursive --all --force" -- ${cur}))
            ;;
        list|ls)
            COMPREPLY=($(compgen -W "--all --json" -- ${cur}))
            ;;
        init)
            COMPREPLY=($(compgen -W "--dump" -- ${cur}))
            ;;
    esac
}

complete -F _aka_completion aka
)";
}

void generateZshCompletion() {
    std::cout << R"ZSH(#compdef aka
# Zsh completion for aka

_aka_aliases() {
  local -a names
  names=(${(f)"$(aka list --all 2>/dev/null | awk '{print $1}')"})
  _describe 'alias' names
}

_arguments -C \
  '(-h --help)'{-h,--help}'[Show help information]' \
  '(-v --version)'{-v,--version}'[Show version information]' \
  '--json[Enable JSON output]' \
  '1:command:->command' \
  '*::arg:->args'

case $state in
  command)
    _alternative \
      'commands:command:((add\:"Add an alias" remove\:"Remove an alias" rm\:"Remove an alias" list\:"List aliases" ls\:"List aliases" init\:"Print shell hook" install\:"Install shell hook" completion\:"Generate completion script" version\:"Show version" help\:"Show help"))' \
      'aliases:alias:_aka_aliases'
    ;;
  args)
    case $words[1] in
      add)
        _arguments \
          '(-s --scope)'{-s,--scope}'[Limit to a directory]:directory:_directories' \
          '(-r --recursive)'{-r,--recursive}'[Include subdirectories]' \
          '(-n --limit)'{-n,--limit}'[History entries to offer]:count:'
        ;;
      remove|rm)
        _arguments \
          '(-s --scope)'{-s,--scope}'[Scope to remove]:directory:_directories' \
          '(-r --recursive)'{-r,--recursive}'[Recursive scope]' \
          '(-a --all)'{-a,--all}'[Remove every alias]' \
          '(-f --force)'{-f,--force}'[Skip confirmation]' \
          '1:alias:_aka_aliases'
        ;;
      list|ls)
        _arguments \
          '(-a --all)'{-a,--all}'[Ignore the current directory]' \
          '--json[JSON output]'
        ;;
      init)
        _arguments '--dump[Print alias functions]'
        ;;
      completion)
        _values 'shell' bash zsh
        ;;
    esac
    ;;
esac
)ZSH";
}

} // namespace cli
} // namespace aka
