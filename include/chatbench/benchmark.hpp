#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "chatbench/chat_client.hpp"
#include "chatbench/types.hpp"

namespace chatbench {

struct BenchmarkEntry {
  std::size_t m_index{0};
  std::string m_prompt;
  InferenceOutcome m_outcome;
};

struct BenchmarkSummary {
  std::size_t m_attempted{0};
  std::size_t m_completed{0};
  double m_minFirstTokenMs{0.0};
  double m_avgFirstTokenMs{0.0};
  double m_maxFirstTokenMs{0.0};
  double m_minTotalMs{0.0};
  double m_avgTotalMs{0.0};
  double m_maxTotalMs{0.0};
  // Mean over results that reported a positive throughput only.
  double m_avgTokensPerSecond{0.0};
};

struct BenchmarkReport {
  std::string m_startedAt;
  std::string m_model;
  std::string m_target;
  std::vector<BenchmarkEntry> m_entries;
  BenchmarkSummary m_summary;
};

struct BenchmarkOptions {
  std::string m_systemPrompt;
  std::string m_warmupPrompt{"Hello."};
  std::string m_model;
  std::string m_target;
};

BenchmarkSummary summarize(const std::vector<InferenceResult>& results, std::size_t attempted);
std::string rate_first_token_latency(double avg_first_token_ms);

const std::vector<std::string>& default_benchmark_prompts();
// One prompt per line; blank lines and '#' comments are skipped.
std::vector<std::string> load_prompts(const std::string& path);

std::vector<std::string> format_report(const BenchmarkReport& report);
// Appends the formatted report; never truncates earlier runs.
void append_report(const std::string& path, const BenchmarkReport& report);

class BenchmarkRunner {
 public:
  BenchmarkRunner(IChatClient& client, BenchmarkOptions options, std::ostream& out);

  BenchmarkReport run(const std::vector<std::string>& prompts);

 private:
  void print_result(const InferenceResult& result);
  void print_summary(const BenchmarkSummary& summary);

  IChatClient& m_client;
  BenchmarkOptions m_options;
  std::ostream& m_out;
};

}  // namespace chatbench
