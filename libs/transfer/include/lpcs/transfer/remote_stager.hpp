/**
 * @file remote_stager.hpp
 * @brief Staging of statistic inputs and published outputs between hosts.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "lpcs/core/interfaces.hpp"

namespace lpcs::transfer {

/**
 * @brief Outcome of one fetch or publish.
 */
struct TransferResult {
  std::vector<std::filesystem::path> files{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Interface for moving directory trees to and from the order host.
 */
class IRemoteFileStager {
 public:
  virtual ~IRemoteFileStager() = default;
  /**
   * @brief Replace `local_dir` with a copy of `remote_dir`.
   */
  [[nodiscard]] virtual TransferResult fetch(const std::string& remote_dir, const std::filesystem::path& local_dir) = 0;
  /**
   * @brief Copy every regular file of `local_dir` into `remote_dir` and verify checksums.
   */
  [[nodiscard]] virtual TransferResult publish(const std::filesystem::path& local_dir, const std::string& remote_dir) = 0;
};

/**
 * @brief scp/ssh backed stager; `localhost` is served with local cp/mkdir/cksum.
 */
class ScpRemoteFileStager final : public IRemoteFileStager {
 public:
  /**
   * @brief Stager configuration.
   */
  struct Config {
    std::string host{"localhost"};
    std::string ssh_options{"-q -o StrictHostKeyChecking=no"};
  };

  ScpRemoteFileStager(const core::ICommandExecutor& executor, Config config)
      : executor_(executor), config_(std::move(config)) {}

  [[nodiscard]] TransferResult fetch(const std::string& remote_dir, const std::filesystem::path& local_dir) override;
  [[nodiscard]] TransferResult publish(const std::filesystem::path& local_dir, const std::string& remote_dir) override;

  /**
   * @brief Compare `cksum` of a local file against its remote copy.
   * @return `ChecksumMismatch` when the CRC tokens differ.
   */
  [[nodiscard]] core::Status verify(const std::filesystem::path& local_file, const std::string& remote_file,
                                    std::string& message) const;

 private:
  [[nodiscard]] bool is_local() const noexcept { return config_.host == "localhost"; }
  [[nodiscard]] std::string remote_shell(const std::string& command) const;

  const core::ICommandExecutor& executor_;
  Config config_{};
};

}  // namespace lpcs::transfer
