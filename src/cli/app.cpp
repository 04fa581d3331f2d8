#include "chatbench/app.hpp"

#include <memory>
#include <stdexcept>

#include "chatbench/benchmark.hpp"
#include "chatbench/chat_client.hpp"
#include "chatbench/config.hpp"
#include "chatbench/conversation.hpp"
#include "chatbench/repl.hpp"

namespace chatbench {
namespace {

int run_check(const ClientConfig& client, std::ostream& out) {
  const HealthReport report = check_server_health(client);
  if (!report.m_reachable) {
    out << "[FAIL] Cannot connect to " << client.base_url << ": " << report.m_detail << "\n";
    return 1;
  }
  out << "[OK] Server is running at " << client.base_url << "\n";
  if (!report.m_models.empty()) {
    out << "  Available models:\n";
    for (const auto& name : report.m_models) {
      out << "   - " << name << "\n";
    }
  }
  if (!report.m_modelAvailable) {
    out << "[FAIL] " << report.m_detail << "\n";
    return 1;
  }
  out << "[OK] Target model '" << client.model << "' is available as " << report.m_matchedModel << "\n";
  return 0;
}

int run_benchmark(const AppConfig& config, const std::string& system_prompt, std::ostream& out,
                  std::ostream& err) {
  const std::vector<std::string> prompts =
      config.prompts_file.empty() ? default_benchmark_prompts() : load_prompts(config.prompts_file);

  std::unique_ptr<IChatClient> client = make_ollama_client(config.client);
  BenchmarkOptions options;
  options.m_systemPrompt = system_prompt;
  options.m_warmupPrompt = config.warmup_prompt;
  options.m_model = config.client.model;
  options.m_target = config.client.base_url;

  BenchmarkRunner runner(*client, options, out);
  const BenchmarkReport report = runner.run(prompts);

  try {
    append_report(config.log_file, report);
    out << "[Saved] " << config.log_file << "\n";
  } catch (const std::exception& ex) {
    err << "warning: could not save log: " << ex.what() << "\n";
  }
  return report.m_summary.m_completed > 0 ? 0 : 1;
}

int run_chat(const AppConfig& config, const std::string& system_prompt, std::istream& in, std::ostream& out) {
  std::unique_ptr<IChatClient> client = make_ollama_client(config.client);
  Conversation conversation(config.max_history_turns, config.history_trim);
  ReplOptions options;
  options.m_systemPrompt = system_prompt;
  options.m_assistantName = config.assistant_name;
  options.m_model = config.client.model;
  options.m_target = config.client.base_url;

  Repl repl(*client, conversation, options, in, out);
  return repl.run();
}

}  // namespace

bool is_url(const std::string& arg) { return arg.rfind("http://", 0) == 0 || arg.rfind("https://", 0) == 0; }

CliOptions parse_cli(int argc, const char* const* argv) {
  CliOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      options.m_showHelp = true;
      return options;
    }
    if (arg == "--chat") {
      options.m_chat = true;
    } else if (arg == "--check") {
      options.m_check = true;
    } else if (arg == "--config" && i + 1 < argc) {
      options.m_configPath = argv[++i];
    } else if (is_url(arg)) {
      options.m_baseUrl = arg;
    } else {
      options.m_ignored.push_back(arg);
    }
  }
  return options;
}

void print_usage(std::ostream& out) {
  out << "Usage: chatbench [BASE_URL] [--chat] [--check] [--config PATH]\n";
  out << "\n";
  out << "  BASE_URL       Ollama server URL (default: http://localhost:11434)\n";
  out << "  --chat         Interactive chat mode (default: benchmark)\n";
  out << "  --check        Check the server is reachable and the model is pulled\n";
  out << "  --config PATH  Config file (default: chatbench.conf)\n";
  out << "  --help, -h     Show this help\n";
  out << "\n";
  out << "Examples:\n";
  out << "  chatbench                                  # benchmark localhost\n";
  out << "  chatbench http://192.168.11.5:11434        # benchmark remote\n";
  out << "  chatbench --chat                           # chat localhost\n";
  out << "  chatbench http://192.168.11.5:11434 --chat # chat remote\n";
}

int run_cli(int argc, const char* const* argv, std::istream& in, std::ostream& out, std::ostream& err) {
  const CliOptions cli = parse_cli(argc, argv);
  if (cli.m_showHelp) {
    print_usage(out);
    return 0;
  }
  for (const auto& arg : cli.m_ignored) {
    err << "warning: ignoring unrecognized argument: " << arg << "\n";
  }

  try {
    AppConfig config = AppConfig::load_from_file(cli.m_configPath);
    if (!cli.m_baseUrl.empty()) {
      config.client.base_url = cli.m_baseUrl;
    }

    out << "chatbench\n";
    out << "Target: " << config.client.base_url << "\n\n";

    if (cli.m_check) {
      return run_check(config.client, out);
    }

    const std::string system_prompt = config.resolve_system_prompt();
    if (cli.m_chat) {
      return run_chat(config, system_prompt, in, out);
    }
    return run_benchmark(config, system_prompt, out, err);
  } catch (const std::exception& ex) {
    err << "fatal: " << ex.what() << "\n";
    return 1;
  }
}

}  // namespace chatbench
