/**
 * @file interfaces.hpp
 * @brief Core collaborator interfaces shared by rendering and transfer code.
 * @author Watosn
 */
#pragma once

#include <string>

#include "lpcs/core/types.hpp"

namespace lpcs::core {

/**
 * @brief Outcome of one shell-level command.
 */
struct CommandResult {
  std::string output{};
  int exit_code{};
  Status status{Status::Ok};
  std::string message{};
};

/**
 * @brief Single-quote `text` for `/bin/sh`.
 */
inline std::string shell_quote(const std::string& text) {
  std::string out = "'";
  for (const char c : text) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += '\'';
  return out;
}

/**
 * @brief Interface for running a shell-level command.
 */
class ICommandExecutor {
 public:
  virtual ~ICommandExecutor() = default;
  /**
   * @brief Run a command and capture combined stdout/stderr.
   * @param command Command line passed to the shell.
   * @return Result with `status` set to `CommandFailed` on a signal or nonzero exit.
   */
  [[nodiscard]] virtual CommandResult run(const std::string& command) const = 0;
};

}  // namespace lpcs::core
