#include "ferry/transfer/command_connector.hpp"

#include "ferry/util/log.hpp"

#include <filesystem>
#include <format>
#include <ranges>

namespace ferry {

namespace fs = std::filesystem;

namespace {

auto last_line(std::string_view output) -> std::string_view {
  while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
    output.remove_suffix(1);
  }
  auto pos = output.rfind('\n');
  return pos == std::string_view::npos ? output : output.substr(pos + 1);
}

}  // namespace

auto shell_quote(std::string_view value) -> std::string {
  std::string out;
  out.reserve(value.size() + 2);
  out += '\'';
  for (char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += '\'';
  return out;
}

CommandConnector::CommandConnector(ConnectorConfig config)
    : config_(std::move(config)),
      timeout_(std::chrono::seconds(config_.command_timeout_sec)) {
}

auto CommandConnector::render(std::string_view tmpl, std::string_view local,
                              std::string_view remote) const -> std::string {
  std::string out;
  out.reserve(tmpl.size() + local.size() + remote.size());

  std::size_t pos = 0;
  while (pos < tmpl.size()) {
    auto open = tmpl.find('{', pos);
    if (open == std::string_view::npos) {
      out.append(tmpl.substr(pos));
      break;
    }
    auto close = tmpl.find('}', open);
    if (close == std::string_view::npos) {
      out.append(tmpl.substr(pos));
      break;
    }
    out.append(tmpl.substr(pos, open - pos));

    auto name = tmpl.substr(open + 1, close - open - 1);
    if (name == "local") {
      out += shell_quote(local);
    } else if (name == "remote") {
      out += shell_quote(remote);
    } else if (name == "remote_shell") {
      out += shell_quote(shell_quote(remote));
    } else if (name == "host") {
      out += shell_quote(config_.host);
    } else if (name == "port") {
      out += std::to_string(config_.port);
    } else if (name == "user") {
      out += shell_quote(config_.username);
    } else if (name == "identity") {
      if (!config_.private_key_path.empty()) {
        out += "-i " + shell_quote(config_.private_key_path);
      }
    } else {
      out.append(tmpl.substr(open, close - open + 1));
    }
    pos = close + 1;
  }
  return out;
}

auto CommandConnector::run(std::string_view op, const std::string& tmpl,
                           std::string_view local, std::string_view remote)
    -> TransferResult<ProcessResult> {
  auto cmd = render(tmpl, local, remote);
  log::debug("{}: {}", op, cmd);

  auto result = run_command(cmd, timeout_);
  if (!result.error.empty()) {
    return std::unexpected(std::format("{} failed: {}", op, result.error));
  }
  if (result.timed_out) {
    return std::unexpected(std::format("{} failed: timed out after {}s", op,
                                       timeout_.count()));
  }
  if (result.exit_code != 0) {
    return std::unexpected(std::format("{} failed (exit {}): {}", op,
                                       result.exit_code,
                                       last_line(result.output)));
  }
  return result;
}

auto CommandConnector::connect() -> TransferResult<void> {
  auto r = run("connect", config_.commands.connect, "", "");
  if (!r) {
    connected_ = false;
    return std::unexpected(r.error());
  }
  connected_ = true;
  log::info("Connected to {}@{}:{}", config_.username, config_.host,
            config_.port);
  return {};
}

auto CommandConnector::disconnect() -> void {
  connected_ = false;
}

auto CommandConnector::upload(const std::string& local,
                              const std::string& remote,
                              const ProgressCallback& on_progress)
    -> TransferResult<void> {
  std::error_code ec;
  auto size = fs::file_size(local, ec);
  if (ec) {
    return std::unexpected(std::format("{}: {}", local, ec.message()));
  }
  auto total = static_cast<std::int64_t>(size);

  if (on_progress) {
    on_progress(0, total);
  }
  auto parent = fs::path{remote}.parent_path().generic_string();
  if (!config_.commands.mkdir.empty() && !parent.empty() && parent != "/" &&
      parent != ".") {
    if (auto m = run("mkdir", config_.commands.mkdir, "", parent); !m) {
      return std::unexpected(m.error());
    }
  }
  auto r = run("upload", config_.commands.upload, local, remote);
  if (!r) {
    return std::unexpected(r.error());
  }
  if (on_progress) {
    on_progress(total, total);
  }
  return {};
}

auto CommandConnector::download(const std::string& remote,
                                const std::string& local,
                                const ProgressCallback& on_progress)
    -> TransferResult<void> {
  if (auto parent = fs::path{local}.parent_path(); !parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(
          std::format("{}: {}", parent.string(), ec.message()));
    }
  }

  // The command writes beside the destination; an existing local file is
  // only replaced once the transfer succeeded.
  auto part = local + ".part";
  auto r = run("download", config_.commands.download, part, remote);
  std::error_code ec;
  if (!r) {
    fs::remove(part, ec);
    return std::unexpected(r.error());
  }

  auto size = fs::file_size(part, ec);
  if (ec) {
    return std::unexpected(
        std::format("download failed: {} missing after transfer", part));
  }
  fs::rename(part, local, ec);
  if (ec) {
    fs::remove(part, ec);
    return std::unexpected(std::format("{}: {}", local, ec.message()));
  }
  if (on_progress) {
    auto total = static_cast<std::int64_t>(size);
    on_progress(total, total);
  }
  return {};
}

auto CommandConnector::remove(const std::string& remote)
    -> TransferResult<void> {
  auto r = run("delete", config_.commands.remove, "", remote);
  if (!r) {
    return std::unexpected(r.error());
  }
  return {};
}

auto CommandConnector::list(const std::string& remote_dir)
    -> TransferResult<std::vector<RemoteEntry>> {
  auto r = run("list", config_.commands.list, "", remote_dir);
  if (!r) {
    return std::unexpected(r.error());
  }

  std::vector<RemoteEntry> entries;
  for (auto part : r->output | std::views::split('\n')) {
    std::string_view line{part.begin(), part.end()};
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (line.empty()) {
      continue;
    }
    RemoteEntry e;
    if (line.back() == '/') {
      e.is_dir = true;
      line.remove_suffix(1);
    }
    e.name = std::string(line);
    entries.push_back(std::move(e));
  }
  return entries;
}

}  // namespace ferry
