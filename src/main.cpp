#include "ferry/cli/commands.hpp"

#include <charconv>
#include <cstdlib>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr std::string_view kVersion = "0.1.0";

void print_usage(const char* prog) {
  std::println("ferry - scheduled remote file transfers");
  std::println("Usage: {} [-c <config>] <command> [options]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  serve [-d|--daemon]       Run the scheduler until SIGINT/SIGTERM");
  std::println("  add --type <upload|download|delete> --source <path>");
  std::println("      [--dest <path>] [--at <ISO-8601> | --in <minutes>]");
  std::println("      [--every <minutes>]   Schedule a transfer, print its id");
  std::println("  list                      Show scheduled tasks");
  std::println("  remove <id-or-prefix>     Delete a task");
  std::println("  run-due                   Run every due task once and exit");
  std::println("  history [--task <id>] [--limit <n>]");
  std::println("                            Show recent executions");
  std::println("  put <local> <remote>       Upload a file now");
  std::println("  get <remote> <local>      Download a file now");
  std::println("  rm <remote>               Delete a remote file now");
  std::println("  check                     Test the connection");
  std::println("  ls [<remote-dir>]         List a remote directory");
  std::println("  validate                  Check the config file");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>       Config file (YAML)");
  std::println("  -v, --version             Show version and exit");
  std::println("  -h, --help                Show this help message");
  std::println("");
  std::println("Timestamps without an offset are UTC.");
  std::println("While serve owns the task file, add and remove are queued in");
  std::println("<tasks_file>.spool and applied by serve before its next pass.");
  std::println("");
  std::println("Examples:");
  std::println("  {} -c ferry.yaml add --type upload --source ./a.txt "
               "--dest a.txt --every 15",
               prog);
  std::println("  {} -c ferry.yaml serve -d", prog);
}

void print_version() {
  std::println("ferry v{}", kVersion);
}

[[noreturn]] void usage_error(const char* prog, std::string_view message) {
  std::println(stderr, "Error: {}", message);
  std::println(stderr, "Run '{} --help' for usage.", prog);
  std::exit(1);
}

auto parse_int(std::string_view text) -> std::optional<int> {
  int value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

// Walks argv after the command name.
class Args {
public:
  Args(int argc, char* argv[], int start)
      : argc_(argc), argv_(argv), i_(start) {
  }

  [[nodiscard]] auto done() const -> bool {
    return i_ >= argc_;
  }
  auto next() -> std::string_view {
    return argv_[i_++];
  }
  auto value(std::string_view flag) -> std::string {
    if (i_ >= argc_) {
      usage_error(argv_[0], std::format("{} requires an argument", flag));
    }
    return argv_[i_++];
  }
  auto int_value(std::string_view flag) -> int {
    auto text = value(flag);
    auto n = parse_int(text);
    if (!n) {
      usage_error(argv_[0], std::format("{} expects a number, got '{}'", flag,
                                        text));
    }
    return *n;
  }
  [[nodiscard]] auto prog() const -> const char* {
    return argv_[0];
  }

private:
  int argc_;
  char** argv_;
  int i_;
};

auto run_serve(Args& args, std::string config_file) -> int {
  ferry::cli::ServeOptions opts{.config_file = std::move(config_file)};
  while (!args.done()) {
    auto arg = args.next();
    if (arg == "-d" || arg == "--daemon") {
      opts.daemon = true;
    } else {
      usage_error(args.prog(), std::format("serve: unknown option {}", arg));
    }
  }
  return ferry::cli::cmd_serve(opts);
}

auto run_add(Args& args, std::string config_file) -> int {
  ferry::cli::AddOptions opts{.config_file = std::move(config_file)};
  while (!args.done()) {
    auto arg = args.next();
    if (arg == "--type") {
      opts.type = args.value(arg);
    } else if (arg == "--source") {
      opts.source = args.value(arg);
    } else if (arg == "--dest") {
      opts.destination = args.value(arg);
    } else if (arg == "--at") {
      opts.at = args.value(arg);
    } else if (arg == "--in") {
      opts.in_minutes = args.int_value(arg);
    } else if (arg == "--every") {
      opts.every_minutes = args.int_value(arg);
    } else {
      usage_error(args.prog(), std::format("add: unknown option {}", arg));
    }
  }
  if (opts.type.empty() || opts.source.empty()) {
    usage_error(args.prog(), "add requires --type and --source");
  }
  return ferry::cli::cmd_add(opts);
}

auto run_remove(Args& args, std::string config_file) -> int {
  ferry::cli::RemoveOptions opts{.config_file = std::move(config_file)};
  if (args.done()) {
    usage_error(args.prog(), "remove requires a task id");
  }
  opts.id = std::string(args.next());
  if (!args.done()) {
    usage_error(args.prog(), "remove takes a single task id");
  }
  return ferry::cli::cmd_remove(opts);
}

auto run_history(Args& args, std::string config_file) -> int {
  ferry::cli::HistoryOptions opts{.config_file = std::move(config_file)};
  while (!args.done()) {
    auto arg = args.next();
    if (arg == "--task") {
      opts.task_id = args.value(arg);
    } else if (arg == "--limit") {
      auto limit = args.int_value(arg);
      if (limit <= 0) {
        usage_error(args.prog(), "--limit must be positive");
      }
      opts.limit = static_cast<std::size_t>(limit);
    } else {
      usage_error(args.prog(), std::format("history: unknown option {}", arg));
    }
  }
  return ferry::cli::cmd_history(opts);
}

auto run_ls(Args& args, std::string config_file) -> int {
  ferry::cli::LsOptions opts{.config_file = std::move(config_file)};
  if (!args.done()) {
    opts.remote_dir = std::string(args.next());
  }
  if (!args.done()) {
    usage_error(args.prog(), "ls takes at most one directory");
  }
  return ferry::cli::cmd_ls(opts);
}

auto run_transfer(Args& args, std::string config_file, ferry::TaskType type,
                  std::string_view command) -> int {
  ferry::cli::TransferOptions opts{.config_file = std::move(config_file),
                                   .type = type};
  auto want = ferry::needs_destination(type) ? 2 : 1;
  std::vector<std::string> paths;
  while (!args.done()) {
    paths.emplace_back(args.next());
  }
  if (static_cast<int>(paths.size()) != want) {
    usage_error(args.prog(),
                std::format("{} takes {} path{}", command, want,
                            want == 1 ? "" : "s"));
  }
  opts.source = std::move(paths[0]);
  if (want == 2) {
    opts.destination = std::move(paths[1]);
  }
  return ferry::cli::cmd_transfer(opts);
}

auto expect_no_args(Args& args, std::string_view command) -> void {
  if (!args.done()) {
    usage_error(args.prog(),
                std::format("{}: unexpected argument {}", command, args.next()));
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_file;
  int i = 1;
  for (; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      return 0;
    } else if (arg == "-c" || arg == "--config") {
      if (++i >= argc) {
        usage_error(argv[0], "--config requires an argument");
      }
      config_file = argv[i];
    } else if (arg.starts_with('-')) {
      usage_error(argv[0], std::format("unknown option {}", arg));
    } else {
      break;
    }
  }

  if (i >= argc) {
    print_usage(argv[0]);
    return 1;
  }

  std::string_view command = argv[i];
  Args args(argc, argv, i + 1);

  if (command == "serve") {
    return run_serve(args, std::move(config_file));
  }
  if (command == "add") {
    return run_add(args, std::move(config_file));
  }
  if (command == "list") {
    expect_no_args(args, command);
    return ferry::cli::cmd_list({.config_file = std::move(config_file)});
  }
  if (command == "remove") {
    return run_remove(args, std::move(config_file));
  }
  if (command == "run-due") {
    expect_no_args(args, command);
    return ferry::cli::cmd_run_due({.config_file = std::move(config_file)});
  }
  if (command == "history") {
    return run_history(args, std::move(config_file));
  }
  if (command == "put") {
    return run_transfer(args, std::move(config_file), ferry::TaskType::Upload,
                        command);
  }
  if (command == "get") {
    return run_transfer(args, std::move(config_file), ferry::TaskType::Download,
                        command);
  }
  if (command == "rm") {
    return run_transfer(args, std::move(config_file), ferry::TaskType::Delete,
                        command);
  }
  if (command == "check") {
    expect_no_args(args, command);
    return ferry::cli::cmd_check({.config_file = std::move(config_file)});
  }
  if (command == "ls") {
    return run_ls(args, std::move(config_file));
  }
  if (command == "validate") {
    expect_no_args(args, command);
    return ferry::cli::cmd_validate({.config_file = std::move(config_file)});
  }

  usage_error(argv[0], std::format("unknown command {}", command));
}
