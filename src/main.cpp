#include "CliOptions.hpp"
#include "GuardedTurn.hpp"
#include "GuardrailConfig.hpp"
#include "GuardrailPipeline.hpp"
#include "PatternLibrary.hpp"
#include "SecurityLog.hpp"
#include "UserStateTracker.hpp"

#include <rang.hpp>

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::optional<chatguard::GuardrailConfig> ResolveConfig(const chatguard::CliOptions& options,
                                                        std::string* error_out) {
  chatguard::GuardrailConfig config;
  if (!options.config_path.empty()) {
    auto loaded = chatguard::LoadConfig(options.config_path, error_out);
    if (!loaded) {
      return std::nullopt;
    }
    config = *loaded;
  }
  if (options.max_warnings) {
    config.max_warnings = *options.max_warnings;
  }
  if (options.input_limit) {
    config.input_length_limit = static_cast<size_t>(*options.input_limit);
  }
  if (options.certainty_threshold) {
    config.certainty_word_threshold = *options.certainty_threshold;
  }
  if (!chatguard::ValidateConfig(config, error_out)) {
    return std::nullopt;
  }
  return config;
}

std::optional<std::vector<chatguard::RuleSpec>> ResolveRules(
    const std::string& path,
    std::vector<chatguard::RuleSpec> defaults,
    std::string* error_out) {
  if (path.empty()) {
    return defaults;
  }
  return chatguard::LoadRuleSpecs(path, error_out);
}

void PrintResult(const chatguard::FilterResult& result, bool json) {
  if (json) {
    nlohmann::json out = {{"allowed", result.allowed},
                          {"message", result.message},
                          {"verdict", chatguard::ToJson(result.verdict)}};
    std::cout << out.dump(2) << "\n";
    return;
  }
  const chatguard::Verdict& verdict = result.verdict;
  std::cout << (result.allowed ? rang::fg::green : rang::fg::red)
            << (result.allowed ? "ALLOWED" : "REJECTED") << rang::fg::reset << "  "
            << rang::fg::yellow << "severity: " << rang::fg::reset
            << chatguard::ToString(verdict.severity()) << "  " << rang::fg::yellow
            << "action: " << rang::fg::reset << chatguard::ToString(verdict.action()) << "  "
            << rang::fg::yellow << "confidence: " << rang::fg::reset << verdict.confidence()
            << "\n";
  std::cout << rang::fg::gray << "reason: " << rang::fg::reset << verdict.reason() << "\n";
  for (const auto& pattern : verdict.patterns()) {
    std::cout << rang::fg::gray << "  - " << pattern << rang::fg::reset << "\n";
  }
  std::cout << rang::fg::cyan << "> " << rang::fg::reset << result.message << "\n";
}

void PrintTurn(const chatguard::TurnResult& turn, bool json) {
  if (json) {
    nlohmann::json out = {{"delivered", turn.delivered},
                          {"reply", turn.reply},
                          {"input", chatguard::ToJson(turn.input.verdict)}};
    if (turn.output) {
      out["output"] = chatguard::ToJson(turn.output->verdict);
    }
    std::cout << out.dump(2) << "\n";
    return;
  }
  PrintResult(turn.input, false);
  if (turn.output) {
    PrintResult(*turn.output, false);
  }
  std::cout << rang::style::bold << (turn.delivered ? rang::fg::green : rang::fg::red)
            << "Reply: " << rang::style::reset << rang::fg::reset << turn.reply << "\n";
}

// Returns false when `line` is not a command.
bool RunCommand(chatguard::GuardrailPipeline& pipeline, const std::string& line, bool json) {
  std::istringstream in(line);
  std::string command;
  std::string user_id;
  in >> command >> user_id;
  if (command == ":health") {
    std::cout << chatguard::ToJson(pipeline.Health()).dump(json ? 2 : -1) << "\n";
    return true;
  }
  if (command == ":status" || command == ":reset") {
    if (user_id.empty()) {
      std::cerr << rang::fg::red << command << " needs a user id." << rang::fg::reset << "\n";
      return true;
    }
    if (command == ":reset") {
      pipeline.Reset(user_id);
    }
    std::cout << chatguard::ToJson(pipeline.Status(user_id)).dump(json ? 2 : -1) << "\n";
    return true;
  }
  return false;
}

}  // namespace

int main(int argc, char** argv) {
  std::string parse_error;
  auto options = chatguard::ParseCli(argc, argv, &parse_error);
  if (!options) {
    std::cerr << parse_error << "\n\n" << chatguard::Usage();
    return 1;
  }
  if (options->help) {
    std::cout << chatguard::Usage();
    return 0;
  }

  std::string error;
  auto config = ResolveConfig(*options, &error);
  if (!config) {
    std::cerr << rang::fg::red << "Invalid configuration: " << rang::fg::reset << error << "\n";
    return 1;
  }
  auto input_rules =
      ResolveRules(options->input_rules_path, chatguard::DefaultInputRules(), &error);
  auto output_rules =
      ResolveRules(options->output_rules_path, chatguard::DefaultOutputRules(), &error);
  if (!input_rules || !output_rules) {
    std::cerr << rang::fg::red << "Failed to load rules: " << rang::fg::reset << error << "\n";
    return 1;
  }

  chatguard::SecurityLog log(options->quiet ? chatguard::SecurityLog::Sink()
                                            : chatguard::SecurityLog::ConsoleSink());
  chatguard::UserStateTracker tracker(config->max_warnings, log);
  std::unique_ptr<chatguard::GuardrailPipeline> pipeline;
  try {
    pipeline = std::make_unique<chatguard::GuardrailPipeline>(
        chatguard::PatternLibrary(*input_rules, *output_rules), *config, tracker, log);
  } catch (const std::exception& ex) {
    std::cerr << rang::fg::red << "Failed to initialize guardrail: " << rang::fg::reset
              << ex.what() << "\n";
    return 1;
  }

  auto check = [&](const std::string& text) {
    if (options->check_output) {
      chatguard::ClassifyContext context;
      context.user_id = options->user_id;
      PrintResult(pipeline->FilterOutput(text, context), options->json);
    } else {
      PrintResult(pipeline->FilterInput(text, options->user_id), options->json);
    }
  };

  if (options->text_set) {
    if (options->reply_set) {
      chatguard::ChatBackend scripted;
      scripted.chat = [&](std::string_view, std::string*) -> std::optional<std::string> {
        return options->reply;
      };
      PrintTurn(chatguard::RunGuardedTurn(*pipeline, scripted, options->text, options->user_id),
                options->json);
    } else {
      check(options->text);
    }
    return 0;
  }

  std::cout << rang::fg::cyan << "Checking " << (options->check_output ? "model output" : "user input")
            << ". Type a message, or 'exit' to quit." << rang::fg::reset << "\n";
  while (true) {
    std::cout << rang::fg::green << "> " << rang::fg::reset;
    std::string line;
    if (!std::getline(std::cin, line)) {
      break;
    }
    if (line == "exit" || line == "quit") {
      break;
    }
    if (!line.empty() && line[0] == ':' && RunCommand(*pipeline, line, options->json)) {
      continue;
    }
    check(line);
  }
  return 0;
}
