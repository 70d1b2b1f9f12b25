// Repository: Stagegate
// Component: Command Dispatcher Interface
// Purpose: Execution collaborator. Runs an approved command as a principal.
// Copyright (c) 2026 Stagegate

#ifndef STAGEGATE_EXECUTION_ICOMMAND_DISPATCHER_HPP_
#define STAGEGATE_EXECUTION_ICOMMAND_DISPATCHER_HPP_

#include <string>

#include "stagegate/staging/StagedRequest.hpp"

namespace stagegate::execution {

class ICommandDispatcher {
 public:
  virtual ~ICommandDispatcher() = default;

  // Presence query: can this principal currently act (connected/online)?
  virtual bool IsActive(const staging::Principal& principal) const = 0;

  // Fire-and-forget. command_text arrives without the leading '/'.
  virtual void Dispatch(const staging::Principal& acting_principal,
                        const std::string& command_text) = 0;
};

}  // namespace stagegate::execution

#endif  // STAGEGATE_EXECUTION_ICOMMAND_DISPATCHER_HPP_
