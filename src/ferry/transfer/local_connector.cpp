#include "ferry/transfer/local_connector.hpp"

#include "ferry/util/log.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <format>
#include <fstream>

namespace ferry {

namespace fs = std::filesystem;

namespace {

// Copies in fixed chunks through a ".part" file renamed into place once
// complete, so a failed copy never leaves a truncated destination.
auto copy_file_chunked(const fs::path& from, const fs::path& to,
                       const ProgressCallback& on_progress)
    -> TransferResult<void> {
  std::error_code ec;
  if (!fs::is_regular_file(from, ec)) {
    return std::unexpected(std::format("{}: no such file", from.string()));
  }
  auto total = static_cast<std::int64_t>(fs::file_size(from, ec));
  if (ec) {
    return std::unexpected(
        std::format("{}: {}", from.string(), ec.message()));
  }

  if (auto parent = to.parent_path(); !parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(
          std::format("{}: {}", parent.string(), ec.message()));
    }
  }

  std::ifstream in(from, std::ios::binary);
  if (!in) {
    return std::unexpected(std::format("{}: cannot open", from.string()));
  }
  auto part = fs::path{to.string() + ".part"};
  std::ofstream out(part, std::ios::binary | std::ios::trunc);
  if (!out) {
    return std::unexpected(std::format("{}: cannot create", part.string()));
  }

  std::array<char, LocalConnector::CHUNK_SIZE> buffer;
  std::int64_t done = 0;
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto n = in.gcount();
    if (n <= 0) {
      break;
    }
    out.write(buffer.data(), n);
    if (!out) {
      out.close();
      fs::remove(part, ec);
      return std::unexpected(std::format("{}: write failed", part.string()));
    }
    done += n;
    if (on_progress) {
      on_progress(done, total);
    }
  }
  if (in.bad()) {
    out.close();
    fs::remove(part, ec);
    return std::unexpected(std::format("{}: read failed", from.string()));
  }
  if (total == 0 && on_progress) {
    on_progress(0, 0);
  }

  out.close();
  if (!out) {
    fs::remove(part, ec);
    return std::unexpected(std::format("{}: write failed", part.string()));
  }
  fs::rename(part, to, ec);
  if (ec) {
    fs::remove(part, ec);
    return std::unexpected(std::format("{}: {}", to.string(), ec.message()));
  }
  return {};
}

}  // namespace

LocalConnector::LocalConnector(fs::path root) : root_(std::move(root)) {
}

auto LocalConnector::connect() -> TransferResult<void> {
  std::error_code ec;
  if (!fs::is_directory(root_, ec)) {
    return std::unexpected(
        std::format("{}: root is not a directory", root_.string()));
  }
  auto canonical = fs::canonical(root_, ec);
  if (ec) {
    return std::unexpected(
        std::format("{}: {}", root_.string(), ec.message()));
  }
  root_ = std::move(canonical);
  connected_ = true;
  log::debug("Local connector rooted at {}", root_.string());
  return {};
}

auto LocalConnector::disconnect() -> void {
  connected_ = false;
}

auto LocalConnector::ensure_connected() const -> TransferResult<void> {
  if (!connected_) {
    return std::unexpected(std::string{"not connected"});
  }
  return {};
}

auto LocalConnector::resolve(const std::string& remote) const
    -> TransferResult<fs::path> {
  auto relative = fs::path{remote}.relative_path().lexically_normal();
  if (!relative.empty() && *relative.begin() == "..") {
    return std::unexpected(
        std::format("{}: path escapes the remote root", remote));
  }
  if (relative.empty() || relative == ".") {
    return root_;
  }
  return root_ / relative;
}

auto LocalConnector::upload(const std::string& local,
                            const std::string& remote,
                            const ProgressCallback& on_progress)
    -> TransferResult<void> {
  if (auto r = ensure_connected(); !r) {
    return r;
  }
  auto target = resolve(remote);
  if (!target) {
    return std::unexpected(target.error());
  }
  return copy_file_chunked(local, *target, on_progress);
}

auto LocalConnector::download(const std::string& remote,
                              const std::string& local,
                              const ProgressCallback& on_progress)
    -> TransferResult<void> {
  if (auto r = ensure_connected(); !r) {
    return r;
  }
  auto source = resolve(remote);
  if (!source) {
    return std::unexpected(source.error());
  }
  return copy_file_chunked(*source, local, on_progress);
}

auto LocalConnector::remove(const std::string& remote)
    -> TransferResult<void> {
  if (auto r = ensure_connected(); !r) {
    return r;
  }
  auto target = resolve(remote);
  if (!target) {
    return std::unexpected(target.error());
  }

  std::error_code ec;
  auto status = fs::symlink_status(*target, ec);
  if (ec || !fs::exists(status)) {
    return std::unexpected(std::format("{}: no such file", remote));
  }
  if (fs::is_directory(status)) {
    return std::unexpected(std::format("{}: is a directory", remote));
  }
  if (!fs::remove(*target, ec) || ec) {
    return std::unexpected(std::format("{}: {}", remote, ec.message()));
  }
  return {};
}

auto LocalConnector::list(const std::string& remote_dir)
    -> TransferResult<std::vector<RemoteEntry>> {
  if (auto r = ensure_connected(); !r) {
    return std::unexpected(r.error());
  }
  auto dir = resolve(remote_dir);
  if (!dir) {
    return std::unexpected(dir.error());
  }

  std::error_code ec;
  fs::directory_iterator it(*dir, ec);
  if (ec) {
    return std::unexpected(std::format("{}: {}", remote_dir, ec.message()));
  }

  std::vector<RemoteEntry> entries;
  for (const auto& entry : it) {
    RemoteEntry e;
    e.name = entry.path().filename().string();
    e.is_dir = entry.is_directory(ec);
    if (!e.is_dir) {
      auto size = entry.file_size(ec);
      e.size = ec ? 0 : static_cast<std::int64_t>(size);
    }
    auto mtime = entry.last_write_time(ec);
    if (!ec) {
      auto sys = std::chrono::clock_cast<std::chrono::system_clock>(mtime);
      e.mtime = std::chrono::duration_cast<std::chrono::seconds>(
                    sys.time_since_epoch())
                    .count();
    }
    entries.push_back(std::move(e));
  }

  std::ranges::sort(entries, [](const RemoteEntry& a, const RemoteEntry& b) {
    if (a.is_dir != b.is_dir) {
      return a.is_dir;
    }
    return a.name < b.name;
  });
  return entries;
}

}  // namespace ferry
