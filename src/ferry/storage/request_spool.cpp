#include "ferry/storage/request_spool.hpp"

#include "ferry/storage/task_codec.hpp"
#include "ferry/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <fstream>
#include <sstream>

namespace ferry {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kRequestExt = ".json";

}  // namespace

RequestSpool::RequestSpool(fs::path directory)
    : directory_(std::move(directory)) {
}

auto RequestSpool::for_tasks_file(std::string_view tasks_file) -> fs::path {
  return fs::path{std::string(tasks_file) + ".spool"};
}

auto RequestSpool::submit(const ControlRequest& request)
    -> Result<std::string> {
  std::error_code ec;
  fs::create_directories(directory_, ec);
  if (ec) {
    log::error("Failed to create {}: {}", directory_.string(), ec.message());
    return fail(Error::PersistenceFailure);
  }

  // Zero-padded so names sort in submission order.
  auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                Clock::now().time_since_epoch())
                .count();
  auto name = std::format("{:020}-{}{}", ns, generate_uuid(), kRequestExt);
  auto target = directory_ / name;
  auto tmp = directory_ / (name + ".tmp");

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out << encode_request(request).dump() << '\n';
    out.close();
    if (!out) {
      log::error("Failed to write {}", tmp.string());
      fs::remove(tmp, ec);
      return fail(Error::PersistenceFailure);
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    log::error("Failed to queue {}: {}", target.string(), ec.message());
    fs::remove(tmp, ec);
    return fail(Error::PersistenceFailure);
  }
  log::debug("Queued control request {}", target.string());
  return name;
}

auto RequestSpool::queued_files() const -> std::vector<fs::path> {
  std::vector<fs::path> files;
  std::error_code ec;
  if (!fs::is_directory(directory_, ec)) {
    return files;
  }
  for (const auto& entry : fs::directory_iterator(directory_, ec)) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    if (entry.path().extension() != kRequestExt) {
      continue;
    }
    files.push_back(entry.path());
  }
  if (ec) {
    log::warn("Failed to scan {}: {}", directory_.string(), ec.message());
  }
  std::ranges::sort(files);
  return files;
}

auto RequestSpool::pending() const -> std::size_t {
  return queued_files().size();
}

auto RequestSpool::reject(const fs::path& file) -> void {
  std::error_code ec;
  auto rejected = file;
  rejected += ".rejected";
  fs::rename(file, rejected, ec);
  if (ec) {
    log::error("Failed to set aside {}: {}", file.string(), ec.message());
    fs::remove(file, ec);
  }
}

auto RequestSpool::drain(const Handler& handler) -> std::size_t {
  std::size_t applied = 0;
  for (const auto& file : queued_files()) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
      log::warn("Cannot open control request {}", file.string());
      continue;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    in.close();

    auto json = nlohmann::json::parse(buffer.str(), nullptr, false);
    auto request = decode_request(json);
    if (!request) {
      log::warn("Malformed control request {}", file.string());
      reject(file);
      continue;
    }

    auto r = handler(*request);
    if (!r && r.error() == Error::TaskRunning) {
      log::debug("Control request {} deferred: task is running",
                 file.filename().string());
      continue;
    }
    if (!r) {
      log::warn("Control request {} refused: {}", file.filename().string(),
                r.error().message());
      reject(file);
      continue;
    }

    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
      log::error("Failed to remove applied request {}: {}", file.string(),
                 ec.message());
    }
    ++applied;
  }
  return applied;
}

}  // namespace ferry
