#include "dockworker/cli/commands.hpp"

#include <charconv>
#include <cstdlib>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("dockworker - run queue tasks inside Docker containers");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  run        Claim, run and report one task");
  std::println("  validate   Check a task payload against the schema");
  std::println("  features   List known features and their defaults");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Worker config (YAML)");
  std::println("  --task <file>         Task definition (JSON)");
  std::println("  --task-id <id>        Task id to claim (run)");
  std::println("  --run-id <n>          Run number to claim (run, default: 0)");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} run -c worker.yaml --task task.json --task-id abc123", prog);
  std::println("  {} validate --task task.json", prog);
}

void print_version() {
  std::println("dockworker v0.1.0");
}

struct Options {
  std::string command;
  std::string config_file;
  std::string task_file;
  std::string task_id;
  int run_id = 0;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "--task") {
      opts.task_file = require_value(i, argc, argv, arg);
    } else if (arg == "--task-id") {
      opts.task_id = require_value(i, argc, argv, arg);
    } else if (arg == "--run-id") {
      auto value = require_value(i, argc, argv, arg);
      auto [ptr, ec] =
          std::from_chars(value.data(), value.data() + value.size(), opts.run_id);
      if (ec != std::errc{} || ptr != value.data() + value.size() ||
          opts.run_id < 0) {
        std::println(stderr, "Error: invalid --run-id '{}'", value);
        std::exit(1);
      }
    } else if (opts.command.empty() && !arg.starts_with('-')) {
      opts.command = arg;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  if (opts.command == "run") {
    if (opts.config_file.empty() || opts.task_file.empty() ||
        opts.task_id.empty()) {
      std::println(stderr,
                   "Error: run requires -c <file>, --task <file> and --task-id <id>");
      return 1;
    }
    return dockworker::cli::cmd_run({
        .config_file = opts.config_file,
        .task_file = opts.task_file,
        .task_id = opts.task_id,
        .run_id = opts.run_id,
    });
  }
  if (opts.command == "validate") {
    if (opts.task_file.empty()) {
      std::println(stderr, "Error: validate requires --task <file>");
      return 1;
    }
    return dockworker::cli::cmd_validate({.task_file = opts.task_file});
  }
  if (opts.command == "features") {
    return dockworker::cli::cmd_features({.config_file = opts.config_file});
  }

  print_usage(argv[0]);
  return 1;
}
