#include "GuardrailConfig.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace chatguard {
namespace {

bool ReadInt(const nlohmann::json& root, const char* key, int* out, std::string* error_out) {
  auto it = root.find(key);
  if (it == root.end()) {
    return true;
  }
  if (!it->is_number_integer()) {
    if (error_out) {
      *error_out = std::string("Config key '") + key + "' must be an integer.";
    }
    return false;
  }
  *out = it->get<int>();
  return true;
}

}  // namespace

bool ValidateConfig(const GuardrailConfig& config, std::string* error_out) {
  if (config.max_warnings < 1) {
    if (error_out) {
      *error_out = "max_warnings must be >= 1";
    }
    return false;
  }
  if (config.input_length_limit < 1) {
    if (error_out) {
      *error_out = "input_length_limit must be >= 1";
    }
    return false;
  }
  if (config.certainty_word_threshold < 0) {
    if (error_out) {
      *error_out = "certainty_word_threshold must be >= 0";
    }
    return false;
  }
  if (config.block_duration_seconds < 0) {
    if (error_out) {
      *error_out = "block_duration_seconds must be >= 0";
    }
    return false;
  }
  return true;
}

std::optional<GuardrailConfig> LoadConfig(std::string_view path, std::string* error_out) {
  std::ifstream in{std::string(path)};
  if (!in) {
    if (error_out) {
      *error_out = "Failed to open config file: " + std::string(path);
    }
    return std::nullopt;
  }

  nlohmann::json root;
  try {
    in >> root;
  } catch (const std::exception& ex) {
    if (error_out) {
      *error_out = std::string("Invalid JSON in config file: ") + ex.what();
    }
    return std::nullopt;
  }
  if (!root.is_object()) {
    if (error_out) {
      *error_out = "Invalid config file: root is not an object.";
    }
    return std::nullopt;
  }

  GuardrailConfig config;
  int input_length_limit = static_cast<int>(config.input_length_limit);
  if (!ReadInt(root, "max_warnings", &config.max_warnings, error_out) ||
      !ReadInt(root, "input_length_limit", &input_length_limit, error_out) ||
      !ReadInt(root, "certainty_word_threshold", &config.certainty_word_threshold, error_out) ||
      !ReadInt(root, "block_duration_seconds", &config.block_duration_seconds, error_out)) {
    return std::nullopt;
  }
  if (input_length_limit < 1) {
    if (error_out) {
      *error_out = "input_length_limit must be >= 1";
    }
    return std::nullopt;
  }
  config.input_length_limit = static_cast<size_t>(input_length_limit);

  if (!ValidateConfig(config, error_out)) {
    return std::nullopt;
  }
  return config;
}

}  // namespace chatguard
