/**
 * @file test_remote_stager.cpp
 * @brief Command execution and scp/ssh staging tests.
 * @author Watosn
 */

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "lpcs/transfer/command_executor.hpp"
#include "lpcs/transfer/remote_stager.hpp"

namespace {

using lpcs::core::CommandResult;
using lpcs::core::Status;

// Answers cksum with a fixed CRC per side and accepts every other command.
class ScriptedExecutor final : public lpcs::core::ICommandExecutor {
 public:
  ScriptedExecutor(std::string local_crc, std::string remote_crc)
      : local_crc_(std::move(local_crc)), remote_crc_(std::move(remote_crc)) {}

  CommandResult run(const std::string& command) const override {
    commands.push_back(command);
    if (command.starts_with("cksum ")) {
      return CommandResult{.output = local_crc_ + " 3 file\n"};
    }
    if (command.starts_with("ssh ") && command.find(" cksum ") != std::string::npos) {
      return CommandResult{.output = remote_crc_ + " 3 file\n"};
    }
    return CommandResult{};
  }

  mutable std::vector<std::string> commands{};

 private:
  std::string local_crc_{};
  std::string remote_crc_{};
};

std::filesystem::path fresh_dir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

}  // namespace

int main() {
  namespace tr = lpcs::transfer;

  const tr::PosixCommandExecutor posix{};
  const auto echo = posix.run("echo staged");
  const auto failing = posix.run("exit 3");
  if (echo.status != Status::Ok || echo.output != "staged\n" || failing.status != Status::CommandFailed ||
      failing.exit_code != 3) {
    spdlog::error("posix executor status mismatch");
    return 1;
  }

  const auto root = fresh_dir("lpcs_test_remote_stager");
  const auto order_stats = root / "order" / "stats";
  std::filesystem::create_directories(order_stats);
  std::ofstream(order_stats / "LT50290302015100EDC00_sr_ndvi.stats") << "MINIMUM=1\n";
  std::ofstream(order_stats / "MOD13Q1.A2016033.h10v04.006_NDVI.stats") << "MINIMUM=2\n";

  // localhost is staged with local cp/mkdir/cksum.
  tr::ScpRemoteFileStager local(posix, {.host = "localhost"});
  const auto work = root / "lpcs_statistics";
  std::filesystem::create_directories(work);
  std::ofstream(work / "stale.csv") << "old";
  const auto fetched = local.fetch(order_stats.string(), work);
  if (fetched.status != Status::Ok || fetched.files.size() != 2 || std::filesystem::exists(work / "stale.csv")) {
    spdlog::error("local fetch mismatch: {}", fetched.message);
    return 2;
  }

  const auto published_dir = root / "order" / "lpcs_statistics";
  const auto published = local.publish(work, published_dir.string());
  if (published.status != Status::Ok || published.files.size() != 2 ||
      !std::filesystem::exists(published_dir / "MOD13Q1.A2016033.h10v04.006_NDVI.stats")) {
    spdlog::error("local publish mismatch: {}", published.message);
    return 3;
  }

  std::string message;
  std::ofstream(published_dir / "LT50290302015100EDC00_sr_ndvi.stats") << "MINIMUM=9\n";
  const auto altered = local.verify(work / "LT50290302015100EDC00_sr_ndvi.stats",
                                    (published_dir / "LT50290302015100EDC00_sr_ndvi.stats").string(), message);
  if (altered != Status::ChecksumMismatch) {
    spdlog::error("altered copy should fail checksum validation");
    return 4;
  }

  const ScriptedExecutor matching("1234", "1234");
  tr::ScpRemoteFileStager remote(matching, {.host = "orders.lpcs.internal", .ssh_options = "-q"});
  const auto pushed = remote.publish(work, "/data/order1/lpcs_statistics");
  if (pushed.status != Status::Ok || matching.commands.size() != 6) {
    spdlog::error("remote publish should issue mkdir, scp and a cksum pair per file");
    return 5;
  }
  if (matching.commands[0] != "ssh -q orders.lpcs.internal mkdir -p '/data/order1/lpcs_statistics'" ||
      !matching.commands[1].starts_with("scp -q -C '") ||
      !matching.commands[1].ends_with(" 'orders.lpcs.internal:/data/order1/lpcs_statistics'")) {
    spdlog::error("remote command mismatch: {} | {}", matching.commands[0], matching.commands[1]);
    return 6;
  }

  const ScriptedExecutor mismatching("1234", "9999");
  tr::ScpRemoteFileStager bad(mismatching, {.host = "orders.lpcs.internal", .ssh_options = "-q"});
  const auto rejected = bad.publish(work, "/data/order1/lpcs_statistics");
  if (rejected.status != Status::ChecksumMismatch || rejected.message.find("checksum") == std::string::npos) {
    spdlog::error("checksum mismatch not reported");
    return 7;
  }

  const ScriptedExecutor fetcher("1", "1");
  tr::ScpRemoteFileStager remote_fetch(fetcher, {.host = "orders.lpcs.internal", .ssh_options = "-q"});
  const auto missing = remote_fetch.fetch("/data/order1/stats", root / "never_created");
  if (missing.status != Status::IoError || fetcher.commands.size() != 1 ||
      fetcher.commands[0] != "scp -q -C -r 'orders.lpcs.internal:/data/order1/stats' '" +
                                 (root / "never_created").string() + "'") {
    spdlog::error("remote fetch command mismatch");
    return 8;
  }

  std::filesystem::remove_all(root);
  return 0;
}
