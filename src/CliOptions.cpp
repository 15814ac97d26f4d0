#include "CliOptions.hpp"

#include <sstream>
#include <stdexcept>

namespace chatguard {
namespace {

std::optional<int> ParseInt(const std::string& arg,
                            const std::string& value,
                            int min_value,
                            std::string* error_out) {
  int parsed = 0;
  try {
    size_t used = 0;
    parsed = std::stoi(value, &used);
    if (used != value.size()) {
      throw std::invalid_argument(value);
    }
  } catch (const std::exception&) {
    if (error_out) {
      *error_out = "Invalid " + arg.substr(2) + " value: " + value;
    }
    return std::nullopt;
  }
  if (parsed < min_value) {
    if (error_out) {
      *error_out = arg.substr(2) + " must be >= " + std::to_string(min_value);
    }
    return std::nullopt;
  }
  return parsed;
}

}  // namespace

std::string Usage() {
  std::ostringstream out;
  out << "Usage:\n"
      << "  chatguard [options]\n\n"
      << "Options:\n"
      << "  --text <text>              Check one message (otherwise interactive CLI)\n"
      << "  --reply <text>             Run a full guarded turn with <text> as the model reply\n"
      << "  --user <id>                User id for warning/lockout tracking\n"
      << "  --input                    Check user input (default)\n"
      << "  --output                   Check model output\n"
      << "  --json                     Print verdicts as JSON\n"
      << "  --quiet                    Do not print security log entries\n"
      << "  --config <path>            Load guardrail config from JSON\n"
      << "  --input-rules <path>       Replace input rules with a JSON rules file\n"
      << "  --output-rules <path>      Replace output rules with a JSON rules file\n"
      << "  --max-warnings <n>         Warnings before lockout (default: 3)\n"
      << "  --input-limit <n>          Input length threshold (default: 5000)\n"
      << "  --certainty-threshold <n>  Certainty markers allowed in output (default: 3)\n"
      << "  --help                     Show this help\n\n"
      << "Interactive commands: :status <id>, :reset <id>, :health, exit\n";
  return out.str();
}

std::optional<CliOptions> ParseCli(int argc, char** argv, std::string* error_out) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help") {
      opts.help = true;
      return opts;
    }
    if (arg == "--input") {
      opts.check_output = false;
      continue;
    }
    if (arg == "--output") {
      opts.check_output = true;
      continue;
    }
    if (arg == "--json") {
      opts.json = true;
      continue;
    }
    if (arg == "--quiet") {
      opts.quiet = true;
      continue;
    }
    if (arg == "--text" || arg == "--reply" || arg == "--user" || arg == "--config" ||
        arg == "--input-rules" || arg == "--output-rules" || arg == "--max-warnings" ||
        arg == "--input-limit" || arg == "--certainty-threshold") {
      if (i + 1 >= argc) {
        if (error_out) {
          *error_out = "Missing value for " + arg;
        }
        return std::nullopt;
      }
      std::string value = argv[++i];
      if (arg == "--text") {
        opts.text = value;
        opts.text_set = true;
      } else if (arg == "--reply") {
        opts.reply = value;
        opts.reply_set = true;
      } else if (arg == "--user") {
        opts.user_id = value;
      } else if (arg == "--config") {
        opts.config_path = value;
      } else if (arg == "--input-rules") {
        opts.input_rules_path = value;
      } else if (arg == "--output-rules") {
        opts.output_rules_path = value;
      } else if (arg == "--max-warnings") {
        opts.max_warnings = ParseInt(arg, value, 1, error_out);
        if (!opts.max_warnings) {
          return std::nullopt;
        }
      } else if (arg == "--input-limit") {
        opts.input_limit = ParseInt(arg, value, 1, error_out);
        if (!opts.input_limit) {
          return std::nullopt;
        }
      } else {
        opts.certainty_threshold = ParseInt(arg, value, 0, error_out);
        if (!opts.certainty_threshold) {
          return std::nullopt;
        }
      }
      continue;
    }
    if (error_out) {
      *error_out = "Unknown option: " + arg;
    }
    return std::nullopt;
  }
  if (opts.reply_set && !opts.text_set) {
    if (error_out) {
      *error_out = "--reply requires --text";
    }
    return std::nullopt;
  }
  return opts;
}

}  // namespace chatguard
