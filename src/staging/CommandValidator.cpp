// Repository: Stagegate
// Component: Command Validator
// Copyright (c) 2026 Stagegate

#include "stagegate/staging/CommandValidator.hpp"

#include <cctype>

namespace stagegate::staging {

namespace {

std::string Trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(begin, end - begin);
}

}  // namespace

ValidationResult ValidateCommand(const std::string& command_text) {
  const std::string trimmed = Trim(command_text);
  if (trimmed.empty()) return ValidationResult::kEmpty;
  if (trimmed.front() != kOperationMarker) return ValidationResult::kInvalidSyntax;
  // The operation token must start directly after the marker.
  if (trimmed.size() < 2 || std::isspace(static_cast<unsigned char>(trimmed[1])))
    return ValidationResult::kInvalidSyntax;
  return ValidationResult::kValid;
}

std::string StripOperationMarker(const std::string& command_text) {
  std::string trimmed = Trim(command_text);
  if (!trimmed.empty() && trimmed.front() == kOperationMarker) trimmed.erase(0, 1);
  return trimmed;
}

}  // namespace stagegate::staging
