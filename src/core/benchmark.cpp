#include "chatbench/benchmark.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <time.h>

namespace chatbench {
namespace {

const char* const kRule = "============================================================";

std::string trim(const std::string& value) {
  const auto start = value.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(start, end - start + 1);
}

std::string fixed(double value, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << value;
  return out.str();
}

std::string local_timestamp() {
  const std::time_t raw = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&raw, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

std::string preview(std::string text) {
  std::replace(text.begin(), text.end(), '\n', ' ');
  if (text.size() > 80) {
    text = text.substr(0, 80) + "...";
  }
  return text;
}

std::vector<Message> single_turn(const std::string& system_prompt, const std::string& prompt) {
  return {{Role::System, system_prompt}, {Role::User, prompt}};
}

}  // namespace

BenchmarkSummary summarize(const std::vector<InferenceResult>& results, std::size_t attempted) {
  BenchmarkSummary summary;
  summary.m_attempted = attempted;
  summary.m_completed = results.size();
  if (results.empty()) {
    return summary;
  }

  summary.m_minFirstTokenMs = results.front().m_firstTokenMs;
  summary.m_maxFirstTokenMs = results.front().m_firstTokenMs;
  summary.m_minTotalMs = results.front().m_totalMs;
  summary.m_maxTotalMs = results.front().m_totalMs;

  double sumFirstToken = 0.0;
  double sumTotal = 0.0;
  double sumTps = 0.0;
  std::size_t tpsCount = 0;
  for (const auto& result : results) {
    summary.m_minFirstTokenMs = std::min(summary.m_minFirstTokenMs, result.m_firstTokenMs);
    summary.m_maxFirstTokenMs = std::max(summary.m_maxFirstTokenMs, result.m_firstTokenMs);
    summary.m_minTotalMs = std::min(summary.m_minTotalMs, result.m_totalMs);
    summary.m_maxTotalMs = std::max(summary.m_maxTotalMs, result.m_totalMs);
    sumFirstToken += result.m_firstTokenMs;
    sumTotal += result.m_totalMs;
    if (result.m_tokensPerSecond > 0.0) {
      sumTps += result.m_tokensPerSecond;
      ++tpsCount;
    }
  }

  const double n = static_cast<double>(results.size());
  summary.m_avgFirstTokenMs = sumFirstToken / n;
  summary.m_avgTotalMs = sumTotal / n;
  summary.m_avgTokensPerSecond = tpsCount > 0 ? sumTps / static_cast<double>(tpsCount) : 0.0;
  return summary;
}

std::string rate_first_token_latency(double avg_first_token_ms) {
  if (avg_first_token_ms < 1000.0) {
    return "TTFT < 1s: EXCELLENT for HRI. Robot feels responsive.";
  }
  if (avg_first_token_ms < 2000.0) {
    return "TTFT 1-2s: ACCEPTABLE. Natural conversation pace.";
  }
  return "TTFT > 2s: SLOW. Consider smaller model or network optimization.";
}

const std::vector<std::string>& default_benchmark_prompts() {
  static const std::vector<std::string> prompts = {
      "Please hand me that object on the table.",
      "Can you step aside? I need to pass through.",
      "Follow my instructions carefully.",
      "I need you to do something for me right now.",
      "Stop what you are doing and look at me.",
      "Could you pick up that item and bring it here?",
      "Move to the left side of the room.",
      "I am going to give you a task. Are you ready?",
      "Please wait here until I come back.",
      "Can you help me with this task?",
  };
  return prompts;
}

std::vector<std::string> load_prompts(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("failed to open prompts file: " + path);
  }

  std::vector<std::string> prompts;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    prompts.push_back(line);
  }
  if (prompts.empty()) {
    throw std::runtime_error("prompts file has no prompts: " + path);
  }
  return prompts;
}

std::vector<std::string> format_report(const BenchmarkReport& report) {
  std::vector<std::string> lines;
  lines.push_back(kRule);
  lines.push_back("Benchmark Run: " + report.m_startedAt);
  lines.push_back("Model: " + report.m_model + "  Target: " + report.m_target);
  lines.push_back(kRule);

  for (const auto& entry : report.m_entries) {
    const std::string tag = "[" + std::to_string(entry.m_index) + "] ";
    if (const auto* failure = std::get_if<InferenceFailure>(&entry.m_outcome)) {
      lines.push_back(tag + "FAILED: " + entry.m_prompt + " | " + failure_marker(*failure));
      continue;
    }
    const auto& result = std::get<InferenceResult>(entry.m_outcome);
    lines.push_back(tag + "TTFT " + fixed(result.m_firstTokenMs, 0) + "ms | Total " + fixed(result.m_totalMs, 0) +
                    "ms | " + fixed(result.m_tokensPerSecond, 1) + " tok/s | Q: " + entry.m_prompt +
                    " | A: " + result.m_text);
  }

  const BenchmarkSummary& summary = report.m_summary;
  if (summary.m_completed == 0) {
    lines.push_back("No successful responses.");
    return lines;
  }

  lines.push_back("");
  lines.push_back("--- Summary ---");
  lines.push_back("  Completed    : " + std::to_string(summary.m_completed) + "/" +
                  std::to_string(summary.m_attempted));
  lines.push_back("  TTFT  Min/Avg/Max: " + fixed(summary.m_minFirstTokenMs, 0) + " / " +
                  fixed(summary.m_avgFirstTokenMs, 0) + " / " + fixed(summary.m_maxFirstTokenMs, 0) + " ms");
  lines.push_back("  Total Min/Avg/Max: " + fixed(summary.m_minTotalMs, 0) + " / " + fixed(summary.m_avgTotalMs, 0) +
                  " / " + fixed(summary.m_maxTotalMs, 0) + " ms");
  lines.push_back("  Avg tok/sec  : " + fixed(summary.m_avgTokensPerSecond, 1));
  lines.push_back("");
  return lines;
}

void append_report(const std::string& path, const BenchmarkReport& report) {
  const std::filesystem::path logPath(path);
  const std::filesystem::path parent = logPath.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }

  std::ofstream out(path, std::ios::app);
  if (!out.is_open()) {
    throw std::runtime_error("failed to open benchmark log for append: " + path);
  }
  for (const auto& line : format_report(report)) {
    out << line << '\n';
  }
  if (!out.good()) {
    throw std::runtime_error("failed writing benchmark log: " + path);
  }
}

BenchmarkRunner::BenchmarkRunner(IChatClient& client, BenchmarkOptions options, std::ostream& out)
    : m_client(client), m_options(std::move(options)), m_out(out) {}

BenchmarkReport BenchmarkRunner::run(const std::vector<std::string>& prompts) {
  BenchmarkReport report;
  report.m_startedAt = local_timestamp();
  report.m_model = m_options.m_model;
  report.m_target = m_options.m_target;

  m_out << kRule << "\n";
  m_out << "  chatbench benchmark\n";
  m_out << "  Model : " << m_options.m_model << "\n";
  m_out << "  Target: " << m_options.m_target << "\n";
  m_out << kRule << "\n";
  m_out << "  Start time: " << report.m_startedAt << "\n";
  m_out << "  Messages  : " << prompts.size() << "\n\n";

  // The warm-up outcome is discarded: it absorbs model load time.
  m_out << "  [Warm-up] Loading model...\n";
  m_client.send(single_turn(m_options.m_systemPrompt, m_options.m_warmupPrompt), {});
  m_out << "  [Warm-up] Done. Starting benchmark.\n\n";

  std::vector<InferenceResult> completed;
  for (std::size_t i = 0; i < prompts.size(); ++i) {
    const std::string& prompt = prompts[i];
    m_out << "  [" << (i + 1) << "/" << prompts.size() << "] Sending: " << prompt << "\n";

    InferenceOutcome outcome = m_client.send(single_turn(m_options.m_systemPrompt, prompt), {});
    if (const auto* failure = std::get_if<InferenceFailure>(&outcome)) {
      m_out << "  [SKIP] " << failure_marker(*failure) << "\n\n";
    } else {
      const auto& result = std::get<InferenceResult>(outcome);
      print_result(result);
      completed.push_back(result);
    }
    report.m_entries.push_back({i + 1, prompt, std::move(outcome)});
  }

  report.m_summary = summarize(completed, prompts.size());
  print_summary(report.m_summary);
  return report;
}

void BenchmarkRunner::print_result(const InferenceResult& result) {
  m_out << "         TTFT    : " << fixed(result.m_firstTokenMs, 0) << " ms  (perceived)\n";
  m_out << "         Total   : " << fixed(result.m_totalMs, 0) << " ms\n";
  m_out << "         TPS     : " << fixed(result.m_tokensPerSecond, 1) << " tok/s\n";
  m_out << "         Response: " << preview(result.m_text) << "\n\n";
}

void BenchmarkRunner::print_summary(const BenchmarkSummary& summary) {
  if (summary.m_completed == 0) {
    m_out << "[FAIL] No successful responses. Check the server is running.\n";
    return;
  }

  m_out << kRule << "\n";
  m_out << "  RESULTS SUMMARY\n";
  m_out << kRule << "\n";
  m_out << "  Completed    : " << summary.m_completed << "/" << summary.m_attempted << "\n";
  m_out << "  TTFT  Min/Avg/Max: " << fixed(summary.m_minFirstTokenMs, 0) << " / "
        << fixed(summary.m_avgFirstTokenMs, 0) << " / " << fixed(summary.m_maxFirstTokenMs, 0)
        << " ms  (perceived)\n";
  m_out << "  Total Min/Avg/Max: " << fixed(summary.m_minTotalMs, 0) << " / " << fixed(summary.m_avgTotalMs, 0)
        << " / " << fixed(summary.m_maxTotalMs, 0) << " ms\n";
  m_out << "  Avg tok/sec  : " << fixed(summary.m_avgTokensPerSecond, 1) << "\n\n";
  m_out << "  --- Evaluation ---\n";
  m_out << "  " << rate_first_token_latency(summary.m_avgFirstTokenMs) << "\n\n";
}

}  // namespace chatbench
