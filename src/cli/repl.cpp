#include "chatbench/repl.hpp"

#include <iomanip>
#include <string>
#include <variant>

namespace chatbench {
namespace {

const char* const kRule = "=======================================================";

std::string trim(const std::string& value) {
  const auto start = value.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(start, end - start + 1);
}

std::string to_lower(std::string value) {
  for (char& c : value) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return value;
}

}  // namespace

Repl::Repl(IChatClient& client, Conversation& conversation, ReplOptions options, std::istream& in,
           std::ostream& out)
    : m_client(client), m_conversation(conversation), m_options(std::move(options)), m_in(in), m_out(out) {}

int Repl::run() {
  m_out << kRule << "\n";
  m_out << "  chatbench chat\n";
  m_out << "  Model : " << m_options.m_model << "\n";
  m_out << "  Target: " << m_options.m_target << "\n";
  m_out << "  Type 'quit' to exit | 'reset' to clear history\n";
  m_out << kRule << "\n\n";

  std::string line;
  while (true) {
    m_out << "You: ";
    m_out.flush();
    if (!std::getline(m_in, line)) {
      m_out << "\n[Exiting]\n";
      break;
    }

    const std::string input = trim(line);
    if (input.empty()) {
      continue;
    }

    const std::string command = to_lower(input);
    if (command == "quit") {
      m_out << "[Exiting chat]\n";
      break;
    }
    if (command == "reset") {
      m_conversation.reset();
      m_out << "[History cleared]\n\n";
      continue;
    }

    exchange(input);
  }

  return 0;
}

void Repl::exchange(const std::string& input) {
  m_conversation.append_user(input);
  const std::vector<Message> payload = m_conversation.build_request_payload(m_options.m_systemPrompt);

  m_out << m_options.m_assistantName << ": ";
  m_out.flush();
  bool streamed = false;
  const InferenceOutcome outcome = m_client.send(payload, [&](const std::string& token) {
    streamed = true;
    m_out << token;
    m_out.flush();
  });

  if (const auto* failure = std::get_if<InferenceFailure>(&outcome)) {
    if (streamed) {
      m_out << "\n";
    }
    m_out << failure_marker(*failure) << "\n\n";
    m_conversation.rollback_last_user_turn();
    return;
  }

  const auto& result = std::get<InferenceResult>(outcome);
  if (!streamed) {
    m_out << result.m_text;
  }
  m_out << "\n";
  m_conversation.append_assistant(result.m_text);
  m_out << "      [TTFT " << std::fixed << std::setprecision(0) << result.m_firstTokenMs << " ms | total "
        << result.m_totalMs << " ms | " << m_conversation.turn_count() << " turns]\n\n";
}

}  // namespace chatbench
