// Repository: Stagegate
// Component: Command Validator
// Purpose: Syntactic gate applied before anything enters the lifecycle.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_STAGING_COMMAND_VALIDATOR_HPP_
#define STAGEGATE_STAGING_COMMAND_VALIDATOR_HPP_

#include <string>

namespace stagegate::staging {

inline constexpr char kOperationMarker = '/';

enum class ValidationResult {
  kValid,
  kEmpty,          // Blank after trimming.
  kInvalidSyntax,  // No leading '/', or no token directly after it.
};

// "/op Alice" is valid; "", "   ", "op", "/", "/ op" are not.
ValidationResult ValidateCommand(const std::string& command_text);

// command_text without surrounding whitespace and the leading '/', as handed
// to the dispatcher.
std::string StripOperationMarker(const std::string& command_text);

}  // namespace stagegate::staging

#endif  // STAGEGATE_STAGING_COMMAND_VALIDATOR_HPP_
