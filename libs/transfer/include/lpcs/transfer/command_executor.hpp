/**
 * @file command_executor.hpp
 * @brief `/bin/sh` command executor with combined output capture.
 * @author Watosn
 */
#pragma once

#include <string>

#include "lpcs/core/interfaces.hpp"

namespace lpcs::transfer {

/**
 * @brief Runs commands through popen with stderr folded into stdout.
 */
class PosixCommandExecutor final : public core::ICommandExecutor {
 public:
  /**
   * @brief Run `command`; a signal or nonzero exit status yields `CommandFailed`.
   */
  [[nodiscard]] core::CommandResult run(const std::string& command) const override;
};

}  // namespace lpcs::transfer
