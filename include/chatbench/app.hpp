#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace chatbench {

struct CliOptions {
  bool m_showHelp{false};
  bool m_chat{false};
  bool m_check{false};
  std::string m_configPath{"chatbench.conf"};
  // Empty unless a positional argument with an http:// or https:// scheme was given.
  std::string m_baseUrl;
  std::vector<std::string> m_ignored;
};

bool is_url(const std::string& arg);

// Stops at --help/-h so nothing after it is interpreted.
CliOptions parse_cli(int argc, const char* const* argv);

void print_usage(std::ostream& out);

// Loads config, applies command-line overrides and runs the selected mode.
// Setup errors are reported on err as "fatal: ..." with a return of 1.
int run_cli(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err);

}  // namespace chatbench
