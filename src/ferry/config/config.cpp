#include "ferry/config/config.hpp"

#include "ferry/config/yaml_utils.hpp"
#include "ferry/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <format>
#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<ferry::StorageConfig> {
  static bool decode(const Node& node, ferry::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    const ferry::StorageConfig d{};
    s.tasks_file = ferry::yaml_get_or(node, "tasks_file", d.tasks_file);
    s.history_db = ferry::yaml_get_or(node, "history_db", d.history_db);
    s.history_keep = ferry::yaml_get_or(node, "history_keep", d.history_keep);
    return true;
  }
};

template <>
struct convert<ferry::SchedulerConfig> {
  static bool decode(const Node& node, ferry::SchedulerConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    const ferry::SchedulerConfig d{};
    s.poll_interval_sec =
        ferry::yaml_get_or(node, "poll_interval_sec", d.poll_interval_sec);
    s.autostart = ferry::yaml_get_or(node, "autostart", d.autostart);
    return true;
  }
};

template <>
struct convert<ferry::LoggingConfig> {
  static bool decode(const Node& node, ferry::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    const ferry::LoggingConfig d{};
    l.level = ferry::yaml_get_or(node, "level", d.level);
    l.file = ferry::yaml_get_or(node, "file", d.file);
    return true;
  }
};

template <>
struct convert<ferry::CommandTemplates> {
  static bool decode(const Node& node, ferry::CommandTemplates& c) {
    if (!node.IsMap()) {
      return false;
    }
    const ferry::CommandTemplates d{};
    c.connect = ferry::yaml_get_or(node, "connect", d.connect);
    c.mkdir = ferry::yaml_get_or(node, "mkdir", d.mkdir);
    c.upload = ferry::yaml_get_or(node, "upload", d.upload);
    c.download = ferry::yaml_get_or(node, "download", d.download);
    c.remove = ferry::yaml_get_or(node, "delete", d.remove);
    c.list = ferry::yaml_get_or(node, "list", d.list);
    return true;
  }
};

template <>
struct convert<ferry::ConnectorConfig> {
  static bool decode(const Node& node, ferry::ConnectorConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    const ferry::ConnectorConfig d{};
    auto type_str = ferry::yaml_get_or<std::string>(
        node, "type", std::string(ferry::connector_type_name(d.type)));
    auto type = ferry::parse_connector_type(type_str);
    if (!type) {
      ferry::log::error("Unknown connector type '{}'", type_str);
      return false;
    }
    c.type = *type;
    c.host = ferry::yaml_get_or(node, "host", d.host);
    c.port = ferry::yaml_get_or(node, "port", d.port);
    c.username = ferry::yaml_get_or(node, "username", d.username);
    c.private_key_path =
        ferry::yaml_get_or(node, "private_key_path", d.private_key_path);
    c.root = ferry::yaml_get_or(node, "root", d.root);
    c.command_timeout_sec =
        ferry::yaml_get_or(node, "command_timeout_sec", d.command_timeout_sec);
    if (auto commands = node["commands"]) {
      c.commands = commands.as<ferry::CommandTemplates>();
    }
    return true;
  }
};

template <>
struct convert<ferry::PathsConfig> {
  static bool decode(const Node& node, ferry::PathsConfig& p) {
    if (!node.IsMap()) {
      return false;
    }
    const ferry::PathsConfig d{};
    p.remote_upload_dir =
        ferry::yaml_get_or(node, "remote_upload_dir", d.remote_upload_dir);
    p.local_download_dir =
        ferry::yaml_get_or(node, "local_download_dir", d.local_download_dir);
    return true;
  }
};

template <>
struct convert<ferry::SystemConfig> {
  static bool decode(const Node& node, ferry::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<ferry::StorageConfig>();
    }
    if (auto scheduler = node["scheduler"]) {
      c.scheduler = scheduler.as<ferry::SchedulerConfig>();
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<ferry::LoggingConfig>();
    }
    if (auto connector = node["connector"]) {
      c.connector = connector.as<ferry::ConnectorConfig>();
    }
    if (auto paths = node["paths"]) {
      c.paths = paths.as<ferry::PathsConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace ferry {

namespace {

void to_yaml(YAML::Emitter& out, const StorageConfig& s) {
  const StorageConfig d{};
  out << YAML::BeginMap;
  yaml_emit(out, "tasks_file", s.tasks_file);
  yaml_emit_if_changed(out, "history_db", s.history_db, d.history_db);
  yaml_emit_if_changed(out, "history_keep", s.history_keep, d.history_keep);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const SchedulerConfig& s) {
  const SchedulerConfig d{};
  out << YAML::BeginMap;
  yaml_emit(out, "poll_interval_sec", s.poll_interval_sec);
  yaml_emit_if_changed(out, "autostart", s.autostart, d.autostart);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const LoggingConfig& l) {
  out << YAML::BeginMap;
  yaml_emit(out, "level", l.level);
  if (!l.file.empty()) {
    yaml_emit(out, "file", l.file);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const ConnectorConfig& c) {
  const ConnectorConfig d{};
  out << YAML::BeginMap;
  yaml_emit(out, "type", std::string(connector_type_name(c.type)));
  if (c.type == ConnectorType::Local) {
    yaml_emit(out, "root", c.root);
  } else {
    yaml_emit(out, "host", c.host);
    yaml_emit_if_changed(out, "port", c.port, d.port);
    yaml_emit(out, "username", c.username);
    yaml_emit_if_changed(out, "private_key_path", c.private_key_path,
                         d.private_key_path);
    yaml_emit_if_changed(out, "command_timeout_sec", c.command_timeout_sec,
                         d.command_timeout_sec);
    if (c.commands != d.commands) {
      const CommandTemplates& t = c.commands;
      out << YAML::Key << "commands" << YAML::Value << YAML::BeginMap;
      yaml_emit_if_changed(out, "connect", t.connect, d.commands.connect);
      yaml_emit_if_changed(out, "mkdir", t.mkdir, d.commands.mkdir);
      yaml_emit_if_changed(out, "upload", t.upload, d.commands.upload);
      yaml_emit_if_changed(out, "download", t.download, d.commands.download);
      yaml_emit_if_changed(out, "delete", t.remove, d.commands.remove);
      yaml_emit_if_changed(out, "list", t.list, d.commands.list);
      out << YAML::EndMap;
    }
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const PathsConfig& p) {
  out << YAML::BeginMap;
  yaml_emit(out, "remote_upload_dir", p.remote_upload_dir);
  yaml_emit(out, "local_download_dir", p.local_download_dir);
  out << YAML::EndMap;
}

auto invalid(std::string_view reason) -> std::unexpected<std::error_code> {
  log::error("Invalid configuration: {}", reason);
  return fail(Error::InvalidArgument);
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      return ok(SystemConfig{});
    }
    SystemConfig config = root.as<SystemConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::validate(const SystemConfig& config, bool check_connector)
    -> Result<void> {
  if (config.storage.tasks_file.empty()) {
    return invalid("storage.tasks_file must not be empty");
  }
  if (config.storage.history_keep < 0) {
    return invalid("storage.history_keep must not be negative");
  }
  if (config.scheduler.poll_interval_sec <= 0 ||
      config.scheduler.poll_interval_sec > kMaxPollIntervalSec) {
    return invalid(std::format("scheduler.poll_interval_sec must be in 1..{}",
                               kMaxPollIntervalSec));
  }
  if (!log::is_level_name(config.logging.level)) {
    return invalid("logging.level must be one of trace|debug|info|warn|error");
  }

  if (!check_connector) {
    return ok();
  }

  const auto& c = config.connector;
  switch (c.type) {
    case ConnectorType::Command:
      if (c.host.empty()) {
        return invalid("connector.host is required for the command connector");
      }
      if (c.username.empty()) {
        return invalid(
            "connector.username is required for the command connector");
      }
      if (c.port < 1 || c.port > 65535) {
        return invalid("connector.port must be in 1..65535");
      }
      if (c.command_timeout_sec < 0) {
        return invalid("connector.command_timeout_sec must not be negative");
      }
      break;
    case ConnectorType::Local:
      if (c.root.empty()) {
        return invalid("connector.root is required for the local connector");
      }
      break;
  }
  return ok();
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "storage" << YAML::Value;
  to_yaml(out, config.storage);
  out << YAML::Key << "scheduler" << YAML::Value;
  to_yaml(out, config.scheduler);
  out << YAML::Key << "logging" << YAML::Value;
  to_yaml(out, config.logging);
  out << YAML::Key << "connector" << YAML::Value;
  to_yaml(out, config.connector);
  out << YAML::Key << "paths" << YAML::Value;
  to_yaml(out, config.paths);
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

}  // namespace ferry
