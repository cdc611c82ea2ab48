#pragma once

#include <string>
#include <vector>

namespace aka {
namespace cli {

// Flag expansion
std::vector<std::string> expandShortFlags(const std::vector<std::string>& args);

// Help system
void cmd_help();
void showWelcome();
void showTips();

// Shell completion generation
void generateBashCompletion();
void generateZshCompletion();

} // namespace cli
} // namespace aka
