#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace chatguard {

struct GuardrailConfig {
  // Warnings a user may collect before being locked out.
  int max_warnings = 3;
  // Input longer than this (in characters) is at least medium severity.
  size_t input_length_limit = 5000;
  // More certainty markers than this in one output is at least medium.
  int certainty_word_threshold = 3;
  // Recorded for operators; lockouts do not expire on their own.
  int block_duration_seconds = 3600;
};

bool ValidateConfig(const GuardrailConfig& config, std::string* error_out = nullptr);

// Reads a JSON object. Missing keys keep their defaults.
std::optional<GuardrailConfig> LoadConfig(std::string_view path, std::string* error_out = nullptr);

}  // namespace chatguard
