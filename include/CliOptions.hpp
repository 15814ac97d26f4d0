#pragma once

#include <optional>
#include <string>

namespace chatguard {

struct CliOptions {
  std::string text;
  bool text_set = false;
  std::string reply;
  bool reply_set = false;
  std::string user_id;
  bool check_output = false;
  bool json = false;
  bool quiet = false;
  bool help = false;
  std::string config_path;
  std::string input_rules_path;
  std::string output_rules_path;
  std::optional<int> max_warnings;
  std::optional<int> input_limit;
  std::optional<int> certainty_threshold;
};

std::string Usage();

std::optional<CliOptions> ParseCli(int argc, char** argv, std::string* error_out = nullptr);

}  // namespace chatguard
