/**
 * @file command_executor.cpp
 * @brief Shell command executor implementation.
 * @author Watosn
 */

#include "lpcs/transfer/command_executor.hpp"

#include <array>
#include <cstdio>

#include <sys/wait.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace lpcs::transfer {

core::CommandResult PosixCommandExecutor::run(const std::string& command) const {
  spdlog::debug("exec: {}", command);
  core::CommandResult out{};
  FILE* pipe = ::popen((command + " 2>&1").c_str(), "r");
  if (pipe == nullptr) {
    out.status = core::Status::CommandFailed;
    out.exit_code = -1;
    out.message = fmt::format("failed to start [{}]", command);
    return out;
  }

  std::array<char, 4096> buffer{};
  std::size_t n = 0;
  while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    out.output.append(buffer.data(), n);
  }

  const int status = ::pclose(pipe);
  if (status == -1) {
    out.status = core::Status::CommandFailed;
    out.exit_code = -1;
    out.message = fmt::format("failed to collect status of [{}]", command);
    return out;
  }
  if (WIFSIGNALED(status)) {
    out.status = core::Status::CommandFailed;
    out.exit_code = -WTERMSIG(status);
    out.message = fmt::format("application terminated by signal [{}]", command);
    return out;
  }
  out.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (out.exit_code != 0) {
    out.status = core::Status::CommandFailed;
    out.message = fmt::format("application [{}] returned error code [{}]", command, out.exit_code);
  }
  return out;
}

}  // namespace lpcs::transfer
