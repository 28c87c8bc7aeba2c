#include "ferry/storage/task_store.hpp"

#include "ferry/storage/task_codec.hpp"
#include "ferry/util/log.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace ferry {

namespace fs = std::filesystem;

namespace {

auto write_all(int fd, std::string_view data) -> bool {
  while (!data.empty()) {
    ssize_t n = ::write(fd, data.data(), data.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(n));
  }
  return true;
}

auto sync_directory(const fs::path& dir) -> void {
  auto dir_str = dir.empty() ? std::string{"."} : dir.string();
  int fd = ::open(dir_str.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    log::warn("Failed to open {} for fsync: {}", dir_str, std::strerror(errno));
    return;
  }
  if (::fsync(fd) < 0) {
    log::warn("fsync of directory {} failed: {}", dir_str,
              std::strerror(errno));
  }
  ::close(fd);
}

}  // namespace

TaskStore::TaskStore(std::string path) : path_(std::move(path)) {
}

auto TaskStore::load() -> LoadOutcome {
  records_.clear();
  index_.clear();
  preserve_on_disk_.reset();

  std::error_code ec;
  if (!fs::exists(path_, ec)) {
    if (ec) {
      log::warn("Cannot stat task file {}: {}", path_, ec.message());
      return LoadOutcome::Unreadable;
    }
    log::info("Task file {} not found, starting empty", path_);
    return LoadOutcome::Missing;
  }

  // Whatever is on disk but could not be used stays until the next save
  // has copied it aside.
  std::ifstream file(path_);
  if (!file.is_open() || fs::is_directory(path_, ec)) {
    preserve_on_disk_ = LoadOutcome::Unreadable;
    log::error("Task file {} is unreadable; starting empty and leaving the "
               "file untouched until the next change",
               path_);
    return LoadOutcome::Unreadable;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    preserve_on_disk_ = LoadOutcome::Unreadable;
    log::error("Read error on task file {}; starting empty and leaving the "
               "file untouched until the next change",
               path_);
    return LoadOutcome::Unreadable;
  }

  auto decoded = decode_tasks(buffer.str());
  if (!decoded) {
    preserve_on_disk_ = LoadOutcome::Corrupt;
    log::error("Task file {} is corrupt; starting empty and leaving the file "
               "untouched until the next change",
               path_);
    return LoadOutcome::Corrupt;
  }

  records_ = std::move(*decoded);
  rebuild_index();
  log::info("Loaded {} tasks from {}", records_.size(), path_);
  return LoadOutcome::Loaded;
}

auto TaskStore::save() -> Result<void> {
  if (preserve_on_disk_) {
    if (auto r = backup_unusable_file(*preserve_on_disk_); !r) {
      return r;
    }
    preserve_on_disk_.reset();
  }

  std::string content;
  try {
    content = encode_tasks(records_);
  } catch (const nlohmann::json::exception& e) {
    log::error("Failed to encode tasks: {}", e.what());
    return fail(Error::PersistenceFailure);
  }
  return write_atomically(content);
}

auto TaskStore::backup_unusable_file(LoadOutcome outcome) -> Result<void> {
  auto stamp = std::format(
      "{:%Y%m%dT%H%M%S}",
      std::chrono::floor<std::chrono::seconds>(Clock::now()));
  auto backup =
      std::format("{}.{}-{}", path_, load_outcome_name(outcome), stamp);

  std::error_code ec;
  if (!fs::exists(path_, ec) && !ec) {
    // Removed externally; nothing left to preserve
    return ok();
  }
  fs::copy_file(path_, backup, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    log::error("Refusing to overwrite {} task file {}: backup to {} "
               "failed: {}",
               load_outcome_name(outcome), path_, backup, ec.message());
    return fail(Error::PersistenceFailure);
  }
  log::warn("{} task file {} preserved as {}", load_outcome_name(outcome),
            path_, backup);
  return ok();
}

auto TaskStore::write_atomically(const std::string& content) -> Result<void> {
  fs::path target{path_};
  auto tmp = path_ + ".tmp";

  if (auto parent = target.parent_path(); !parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      log::error("Failed to create {}: {}", parent.string(), ec.message());
      return fail(Error::PersistenceFailure);
    }
  }

  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    log::error("Failed to open {}: {}", tmp, std::strerror(errno));
    return fail(Error::PersistenceFailure);
  }

  if (!write_all(fd, content) || ::fsync(fd) < 0) {
    log::error("Failed to write {}: {}", tmp, std::strerror(errno));
    ::close(fd);
    ::unlink(tmp.c_str());
    return fail(Error::PersistenceFailure);
  }
  if (::close(fd) < 0) {
    log::error("Failed to close {}: {}", tmp, std::strerror(errno));
    ::unlink(tmp.c_str());
    return fail(Error::PersistenceFailure);
  }

  if (::rename(tmp.c_str(), path_.c_str()) < 0) {
    log::error("Failed to replace {}: {}", path_, std::strerror(errno));
    ::unlink(tmp.c_str());
    return fail(Error::PersistenceFailure);
  }

  sync_directory(target.parent_path());
  log::trace("Saved {} tasks to {}", records_.size(), path_);
  return ok();
}

auto TaskStore::add(TaskRecord record) -> Result<void> {
  if (contains(record.id)) {
    return fail(Error::DuplicateId);
  }
  index_.emplace(record.id.str(), records_.size());
  records_.push_back(std::move(record));
  return ok();
}

auto TaskStore::remove(const TaskId& id) -> Result<void> {
  auto it = index_.find(id.value());
  if (it == index_.end()) {
    return fail(Error::NotFound);
  }
  auto pos = it->second;
  records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(pos));
  rebuild_index();
  return ok();
}

auto TaskStore::update(const TaskRecord& record) -> Result<void> {
  auto* existing = find(record.id);
  if (!existing) {
    return fail(Error::NotFound);
  }
  *existing = record;
  return ok();
}

auto TaskStore::get(const TaskId& id) const -> Result<TaskRecord> {
  const auto* record = find(id);
  if (!record) {
    return fail(Error::NotFound);
  }
  return *record;
}

auto TaskStore::find(const TaskId& id) -> TaskRecord* {
  auto it = index_.find(id.value());
  return it == index_.end() ? nullptr : &records_[it->second];
}

auto TaskStore::find(const TaskId& id) const -> const TaskRecord* {
  auto it = index_.find(id.value());
  return it == index_.end() ? nullptr : &records_[it->second];
}

auto TaskStore::contains(const TaskId& id) const -> bool {
  return index_.contains(id.value());
}

auto TaskStore::list() const -> std::vector<TaskRecord> {
  return records_;
}

auto TaskStore::rebuild_index() -> void {
  index_.clear();
  index_.reserve(records_.size());
  for (std::size_t i = 0; i < records_.size(); ++i) {
    index_.emplace(records_[i].id.str(), i);
  }
}

}  // namespace ferry
