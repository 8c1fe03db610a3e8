/**
 * @file remote_stager.cpp
 * @brief scp/ssh staging implementation.
 * @author Watosn
 */

#include "lpcs/transfer/remote_stager.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace lpcs::transfer {
namespace {

std::string first_token(const std::string& text) {
  std::istringstream iss(text);
  std::string tok;
  iss >> tok;
  return tok;
}

}  // namespace

std::string ScpRemoteFileStager::remote_shell(const std::string& command) const {
  return fmt::format("ssh {} {} {}", config_.ssh_options, config_.host, command);
}

TransferResult ScpRemoteFileStager::fetch(const std::string& remote_dir, const std::filesystem::path& local_dir) {
  std::error_code ec;
  std::filesystem::remove_all(local_dir, ec);
  if (ec) {
    return TransferResult{.status = core::Status::IoError,
                          .message = fmt::format("failed to clear {}: {}", local_dir.string(), ec.message())};
  }

  const std::string cmd =
      is_local() ? fmt::format("cp -r {} {}", core::shell_quote(remote_dir), core::shell_quote(local_dir.string()))
                 : fmt::format("scp {} -C -r {} {}", config_.ssh_options,
                               core::shell_quote(config_.host + ":" + remote_dir), core::shell_quote(local_dir.string()));
  const auto r = executor_.run(cmd);
  if (r.status != core::Status::Ok) {
    if (!r.output.empty()) {
      spdlog::info("{}", r.output);
    }
    spdlog::error("Failed retrieving stats from online cache");
    return TransferResult{.status = r.status, .message = r.message};
  }

  TransferResult out{};
  for (const auto& entry : std::filesystem::directory_iterator(local_dir, ec)) {
    if (entry.is_regular_file()) {
      out.files.push_back(entry.path());
    }
  }
  if (ec) {
    return TransferResult{.status = core::Status::IoError,
                          .message = fmt::format("failed to list {}: {}", local_dir.string(), ec.message())};
  }
  std::sort(out.files.begin(), out.files.end());
  spdlog::info("fetched {} files from {}:{}", out.files.size(), config_.host, remote_dir);
  return out;
}

TransferResult ScpRemoteFileStager::publish(const std::filesystem::path& local_dir, const std::string& remote_dir) {
  spdlog::info("Creating {} on {}", remote_dir, config_.host);
  const std::string mkdir_cmd = fmt::format("mkdir -p {}", core::shell_quote(remote_dir));
  const auto made = executor_.run(is_local() ? mkdir_cmd : remote_shell(mkdir_cmd));
  if (made.status != core::Status::Ok) {
    if (!made.output.empty()) {
      spdlog::error("{}", made.output);
    }
    return TransferResult{.status = made.status, .message = made.message};
  }

  TransferResult out{};
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(local_dir, ec)) {
    if (entry.is_regular_file()) {
      out.files.push_back(entry.path());
    }
  }
  if (ec) {
    return TransferResult{.status = core::Status::IoError,
                          .message = fmt::format("failed to list {}: {}", local_dir.string(), ec.message())};
  }
  std::sort(out.files.begin(), out.files.end());
  if (out.files.empty()) {
    spdlog::warn("nothing to publish from {}", local_dir.string());
    return out;
  }

  std::string sources;
  for (const auto& f : out.files) {
    sources += ' ';
    sources += core::shell_quote(f.string());
  }
  const std::string copy_cmd =
      is_local() ? fmt::format("cp{} {}", sources, core::shell_quote(remote_dir))
                 : fmt::format("scp {} -C{} {}", config_.ssh_options, sources,
                               core::shell_quote(config_.host + ":" + remote_dir));
  const auto copied = executor_.run(copy_cmd);
  if (copied.status != core::Status::Ok) {
    if (!copied.output.empty()) {
      spdlog::info("{}", copied.output);
    }
    spdlog::error("Failed to transfer data");
    return TransferResult{.status = copied.status, .message = copied.message};
  }
  spdlog::info("Transfer complete - SCP");

  spdlog::info("Verifying statistics transfers");
  for (const auto& f : out.files) {
    std::string message;
    const auto status = verify(f, remote_dir + "/" + f.filename().string(), message);
    if (status != core::Status::Ok) {
      return TransferResult{.files = out.files, .status = status, .message = message};
    }
  }
  return out;
}

core::Status ScpRemoteFileStager::verify(const std::filesystem::path& local_file, const std::string& remote_file,
                                         std::string& message) const {
  const auto local = executor_.run(fmt::format("cksum {}", core::shell_quote(local_file.string())));
  if (local.status != core::Status::Ok) {
    message = local.message;
    return local.status;
  }
  const std::string remote_cmd = fmt::format("cksum {}", core::shell_quote(remote_file));
  const auto remote = executor_.run(is_local() ? remote_cmd : remote_shell(remote_cmd));
  if (remote.status != core::Status::Ok) {
    message = remote.message;
    return remote.status;
  }

  const std::string local_crc = first_token(local.output);
  const std::string remote_crc = first_token(remote.output);
  if (local_crc.empty() || local_crc != remote_crc) {
    message = fmt::format("Failed checksum validation between {} and {}:{}", local_file.string(), config_.host,
                          remote_file);
    return core::Status::ChecksumMismatch;
  }
  return core::Status::Ok;
}

}  // namespace lpcs::transfer
