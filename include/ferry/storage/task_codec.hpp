#pragma once

#include "ferry/core/error.hpp"
#include "ferry/scheduler/task.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace ferry {

[[nodiscard]] auto encode_task(const TaskRecord& task) -> nlohmann::json;

// ParseError when a field has the wrong type, an enum name is unknown, a
// timestamp does not parse, or the record breaks a task invariant.
[[nodiscard]] auto decode_task(const nlohmann::json& j) -> Result<TaskRecord>;

// The task file: a JSON array of records, pretty-printed.
[[nodiscard]] auto encode_tasks(const std::vector<TaskRecord>& tasks)
    -> std::string;
[[nodiscard]] auto decode_tasks(std::string_view text)
    -> Result<std::vector<TaskRecord>>;

// One queued control request: {"op":"add", ...request fields} or
// {"op":"remove","id":...}. Field checks only; the request is validated
// again when applied.
[[nodiscard]] auto encode_request(const ControlRequest& request)
    -> nlohmann::json;
[[nodiscard]] auto decode_request(const nlohmann::json& j)
    -> Result<ControlRequest>;

}  // namespace ferry
