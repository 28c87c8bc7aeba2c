#include "ferry/storage/task_codec.hpp"

#include "ferry/storage/state_strings.hpp"
#include "ferry/util/log.hpp"

#include <cstdint>

#include <algorithm>
#include <array>
#include <string_view>
#include <unordered_set>

namespace ferry {

namespace {

using json = nlohmann::json;

constexpr std::array<std::string_view, 11> kKnownFields = {
    "id",          "type",       "source",           "destination",
    "scheduled_at", "recurring", "interval_minutes", "status",
    "last_run_at", "last_error", "created_at",
};

auto is_known_field(std::string_view key) -> bool {
  return std::ranges::find(kKnownFields, key) != kKnownFields.end();
}

auto optional_time(const std::optional<TimePoint>& tp) -> json {
  return tp ? json(to_iso8601(*tp)) : json(nullptr);
}

auto optional_string(const std::optional<std::string>& s) -> json {
  return s ? json(*s) : json(nullptr);
}

auto read_string(const json& j, const char* key) -> Result<std::string> {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    log::debug("Task field '{}' missing or not a string", key);
    return fail(Error::ParseError);
  }
  return it->get<std::string>();
}

auto read_optional_string(const json& j, const char* key)
    -> Result<std::optional<std::string>> {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::optional<std::string>{};
  }
  if (!it->is_string()) {
    return fail(Error::ParseError);
  }
  return std::optional<std::string>{it->get<std::string>()};
}

auto read_time(const json& j, const char* key) -> Result<TimePoint> {
  auto text = read_string(j, key);
  if (!text) {
    return fail(text.error());
  }
  auto tp = parse_iso8601(*text);
  if (!tp) {
    log::debug("Task field '{}' is not an ISO-8601 timestamp: {}", key, *text);
    return fail(Error::ParseError);
  }
  return *tp;
}

auto read_interval(const json& j) -> Result<std::optional<int>> {
  auto it = j.find("interval_minutes");
  if (it == j.end() || it->is_null()) {
    return std::optional<int>{};
  }
  if (!it->is_number_integer()) {
    return fail(Error::ParseError);
  }
  auto minutes = it->get<std::int64_t>();
  if (minutes <= 0 || minutes > kMaxIntervalMinutes) {
    log::debug("Interval {} outside 1..{}", minutes, kMaxIntervalMinutes);
    return fail(Error::ParseError);
  }
  return std::optional<int>{static_cast<int>(minutes)};
}

auto read_recurring(const json& j) -> Result<bool> {
  auto it = j.find("recurring");
  if (it == j.end() || it->is_null()) {
    return false;
  }
  if (!it->is_boolean()) {
    return fail(Error::ParseError);
  }
  return it->get<bool>();
}

auto read_optional_time(const json& j, const char* key)
    -> Result<std::optional<TimePoint>> {
  auto text = read_optional_string(j, key);
  if (!text) {
    return fail(text.error());
  }
  if (!*text) {
    return std::optional<TimePoint>{};
  }
  auto tp = parse_iso8601(**text);
  if (!tp) {
    return fail(Error::ParseError);
  }
  return std::optional<TimePoint>{*tp};
}

}  // namespace

auto encode_task(const TaskRecord& task) -> json {
  json j = json::object();

  // Unknown fields first so known ones always win
  for (const auto& [key, value] : task.extensions.items()) {
    if (!is_known_field(key)) {
      j[key] = value;
    }
  }

  j["id"] = task.id.str();
  j["type"] = std::string(task_type_name(task.type));
  j["source"] = task.source;
  j["destination"] = optional_string(task.destination);
  j["scheduled_at"] = to_iso8601(task.scheduled_at);
  j["recurring"] = task.recurring;
  j["interval_minutes"] =
      task.interval_minutes ? json(*task.interval_minutes) : json(nullptr);
  j["status"] = std::string(task_status_name(task.status));
  j["last_run_at"] = optional_time(task.last_run_at);
  j["last_error"] = optional_string(task.last_error);
  j["created_at"] = to_iso8601(task.created_at);
  return j;
}

auto decode_task(const json& j) -> Result<TaskRecord> {
  if (!j.is_object()) {
    return fail(Error::ParseError);
  }

  TaskRecord task;

  auto id = read_string(j, "id");
  if (!id || id->empty()) {
    return fail(Error::ParseError);
  }
  task.id = TaskId{std::move(*id)};

  auto type_name = read_string(j, "type");
  if (!type_name) {
    return fail(type_name.error());
  }
  auto type = parse_task_type(*type_name);
  if (!type) {
    log::debug("Task {} has unknown type '{}'", task.id, *type_name);
    return fail(Error::ParseError);
  }
  task.type = *type;

  auto source = read_string(j, "source");
  if (!source || source->empty()) {
    return fail(Error::ParseError);
  }
  task.source = std::move(*source);

  auto destination = read_optional_string(j, "destination");
  if (!destination) {
    return fail(destination.error());
  }
  if (needs_destination(task.type)) {
    if (!*destination || (*destination)->empty()) {
      return fail(Error::ParseError);
    }
    task.destination = std::move(*destination);
  }

  auto scheduled_at = read_time(j, "scheduled_at");
  if (!scheduled_at) {
    return fail(scheduled_at.error());
  }
  task.scheduled_at = *scheduled_at;

  auto recurring = read_recurring(j);
  if (!recurring) {
    return fail(recurring.error());
  }
  task.recurring = *recurring;

  auto interval = read_interval(j);
  if (!interval) {
    log::debug("Task {} has a malformed interval", task.id);
    return fail(interval.error());
  }
  task.interval_minutes = *interval;
  if (task.recurring) {
    if (!task.interval_minutes) {
      log::debug("Recurring task {} has no interval", task.id);
      return fail(Error::ParseError);
    }
  } else {
    task.interval_minutes.reset();
  }

  if (auto it = j.find("status"); it != j.end() && !it->is_null()) {
    if (!it->is_string()) {
      return fail(Error::ParseError);
    }
    auto status = parse_task_status(it->get<std::string>());
    if (!status) {
      return fail(Error::ParseError);
    }
    task.status = *status;
  }

  auto last_run_at = read_optional_time(j, "last_run_at");
  if (!last_run_at) {
    return fail(last_run_at.error());
  }
  task.last_run_at = *last_run_at;

  auto last_error = read_optional_string(j, "last_error");
  if (!last_error) {
    return fail(last_error.error());
  }
  task.last_error = std::move(*last_error);

  if (j.contains("created_at")) {
    auto created_at = read_time(j, "created_at");
    if (!created_at) {
      return fail(created_at.error());
    }
    task.created_at = *created_at;
  } else {
    task.created_at = task.scheduled_at;
  }

  for (const auto& [key, value] : j.items()) {
    if (!is_known_field(key)) {
      task.extensions[key] = value;
    }
  }

  return task;
}

auto encode_request(const ControlRequest& request) -> json {
  json j = json::object();
  if (request.kind == ControlRequest::Kind::Remove) {
    j["op"] = "remove";
    j["id"] = request.id.str();
    return j;
  }

  const auto& task = request.task;
  j["op"] = "add";
  j["type"] = std::string(task_type_name(task.type));
  j["source"] = task.source;
  j["destination"] = optional_string(task.destination);
  j["scheduled_at"] = to_iso8601(task.scheduled_at);
  j["recurring"] = task.recurring;
  j["interval_minutes"] =
      task.interval_minutes ? json(*task.interval_minutes) : json(nullptr);
  return j;
}

auto decode_request(const json& j) -> Result<ControlRequest> {
  if (!j.is_object()) {
    return fail(Error::ParseError);
  }
  auto op = read_string(j, "op");
  if (!op) {
    return fail(op.error());
  }

  ControlRequest request;
  if (*op == "remove") {
    auto id = read_string(j, "id");
    if (!id || id->empty()) {
      return fail(Error::ParseError);
    }
    request.kind = ControlRequest::Kind::Remove;
    request.id = TaskId{std::move(*id)};
    return request;
  }
  if (*op != "add") {
    log::debug("Unknown control request '{}'", *op);
    return fail(Error::ParseError);
  }

  auto& task = request.task;
  auto type_name = read_string(j, "type");
  if (!type_name) {
    return fail(type_name.error());
  }
  auto type = parse_task_type(*type_name);
  if (!type) {
    return fail(Error::ParseError);
  }
  task.type = *type;

  auto source = read_string(j, "source");
  if (!source) {
    return fail(source.error());
  }
  task.source = std::move(*source);

  auto destination = read_optional_string(j, "destination");
  if (!destination) {
    return fail(destination.error());
  }
  task.destination = std::move(*destination);

  auto scheduled_at = read_time(j, "scheduled_at");
  if (!scheduled_at) {
    return fail(scheduled_at.error());
  }
  task.scheduled_at = *scheduled_at;

  auto recurring = read_recurring(j);
  if (!recurring) {
    return fail(recurring.error());
  }
  task.recurring = *recurring;

  auto interval = read_interval(j);
  if (!interval) {
    return fail(interval.error());
  }
  task.interval_minutes = *interval;
  return request;
}

auto encode_tasks(const std::vector<TaskRecord>& tasks) -> std::string {
  json arr = json::array();
  for (const auto& task : tasks) {
    arr.push_back(encode_task(task));
  }
  return arr.dump(2) + "\n";
}

auto decode_tasks(std::string_view text) -> Result<std::vector<TaskRecord>> {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::exception& e) {
    log::warn("Task file is not valid JSON: {}", e.what());
    return fail(Error::ParseError);
  }

  if (!root.is_array()) {
    log::warn("Task file does not contain a JSON array");
    return fail(Error::ParseError);
  }

  std::vector<TaskRecord> tasks;
  tasks.reserve(root.size());
  std::unordered_set<std::string> seen;

  for (std::size_t i = 0; i < root.size(); ++i) {
    auto task = decode_task(root[i]);
    if (!task) {
      log::warn("Task file record #{} is malformed", i);
      return fail(task.error());
    }
    if (!seen.insert(task->id.str()).second) {
      log::warn("Task file contains duplicate id {}", task->id);
      return fail(Error::ParseError);
    }
    tasks.push_back(std::move(*task));
  }
  return tasks;
}

}  // namespace ferry
