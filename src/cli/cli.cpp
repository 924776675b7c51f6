#include "cli/cli.hpp"
#include "fs/file_system.hpp"
#include "storage/store_factory.hpp"
#include "sync/cancellation.hpp"
#include "sync/sync_controller.hpp"
#include "sync/sync_error.hpp"
#include <csignal>
#include <iostream>
#include <thread>
#include <unordered_map>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>

namespace bsync {
namespace cli {

//==============================================
// ARGUMENT PARSING
//==============================================

ProgramOptions parse_command_line(const std::vector<std::string>& args) {
  // Flags that take a value
  const std::unordered_map<std::string, std::string> value_flags = {
    {"-c", "config"}, {"--config", "config"},
    {"-w", "workers"}, {"--workers", "workers"},
    {"--prefix", "prefix"},
    {"--log-level", "log-level"},
    {"--backend", "backend"},
    {"--fs-root", "fs-root"}
  };

  ProgramOptions options;
  std::vector<std::string> positional;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg == "-h" || arg == "--help") {
      options.help = true;
      return options;
    }
    if (arg == "--delete") {
      options.delete_stale = true;
      continue;
    }
    if (arg == "--no-hash") {
      options.no_hash = true;
      continue;
    }
    if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
      continue;
    }

    auto flag = value_flags.find(arg);
    if (flag == value_flags.end()) {
      if (arg.size() > 1 && arg[0] == '-') {
        options.error = "Unknown argument: " + arg;
        return options;
      }
      positional.push_back(arg);
      continue;
    }

    if (i + 1 >= args.size()) {
      options.error = "Missing value for " + arg;
      return options;
    }
    const std::string& value = args[++i];

    if (flag->second == "config") {
      options.config_path = value;
    } else if (flag->second == "workers") {
      try {
        std::size_t consumed = 0;
        long long workers = std::stoll(value, &consumed);
        if (consumed != value.size() || workers <= 0) {
          throw std::invalid_argument(value);
        }
        options.workers = static_cast<std::size_t>(workers);
      } catch (const std::exception&) {
        options.error = "Invalid worker count: " + value;
        return options;
      }
    } else if (flag->second == "prefix") {
      options.prefix = value;
    } else if (flag->second == "log-level") {
      options.log_level = value;
    } else if (flag->second == "backend") {
      options.backend = value;
    } else if (flag->second == "fs-root") {
      options.fs_root = value;
    }
  }

  if (positional.size() != 3) {
    options.error = positional.empty() ? "Missing command" : "Expected a command and two arguments";
    return options;
  }

  if (positional[0] == "backup") {
    options.command = Command::BACKUP;
    options.directory = positional[1];
    options.bucket = positional[2];
  } else if (positional[0] == "restore") {
    options.command = Command::RESTORE;
    options.bucket = positional[1];
    options.directory = positional[2];
  } else {
    options.error = "Unknown command: " + positional[0];
    return options;
  }

  if (options.directory.empty() || options.bucket.empty()) {
    options.error = "Directory and bucket must not be empty";
    return options;
  }

  options.valid = true;
  return options;
}

void print_usage(std::ostream& os, const std::string& program_name) {
  os << "Usage: " << program_name << " [options] backup <directory_path> <bucket_name>\n"
     << "       " << program_name << " [options] restore <bucket_name> <directory_path>\n"
     << "Options:\n"
     << "  -c, --config <file>    Configuration file (default: ~/.config/bucketsync/config.yaml)\n"
     << "  -w, --workers <n>      Number of concurrent transfers\n"
     << "      --prefix <prefix>  Key prefix inside the bucket\n"
     << "      --delete           Remove destination entries missing from the source\n"
     << "      --no-hash          Compare by size and modification time only; a destination\n"
     << "                         copy of equal size that is newer than the source is kept\n"
     << "      --backend <name>   Storage backend: s3 or filesystem\n"
     << "      --fs-root <dir>    Root directory of the filesystem backend\n"
     << "      --log-level <lvl>  trace, debug, info, warning, error or fatal\n"
     << "  -v, --verbose          Also log to the console\n"
     << "  -h, --help             Show this message\n"
     << "Example: " << program_name << " backup ./documents my-bucket\n";
}

void apply_overrides(const ProgramOptions& options, config::SyncConfig& config) {
  if (options.workers) {
    config.sync.workers = *options.workers;
  }
  if (options.prefix) {
    config.sync.key_prefix = *options.prefix;
  }
  if (options.log_level) {
    config.logging.level = *options.log_level;
  }
  if (options.backend) {
    config.storage.backend = config::parse_backend(*options.backend);
  }
  if (options.fs_root) {
    config.storage.filesystem_root = *options.fs_root;
  }
  if (options.delete_stale) {
    config.sync.delete_stale = true;
  }
  if (options.no_hash) {
    config.sync.compute_hashes = false;
  }
  if (options.verbose) {
    config.logging.console = true;
  }
}

void print_summary(std::ostream& os, const sync::SyncSummary& summary, Command command) {
  const char* verb = command == Command::BACKUP ? "Backup" : "Restore";

  for (const auto& [name, reason] : summary.rejected) {
    os << "Skipped invalid entry " << name << ": " << reason << "\n";
  }
  for (const auto& [path, detail] : summary.failures) {
    os << "FAILED " << path << ": " << detail << "\n";
  }

  if (summary.aborted) {
    os << verb << " aborted: " << summary.abort_reason << "\n";
    return;
  }

  os << summary.succeeded << " transferred, " << summary.failed << " failed, "
     << summary.skipped << " skipped (" << summary.unchanged << " unchanged)";
  if (summary.stale_ignored > 0) {
    os << ", " << summary.stale_ignored << " only on destination (kept)";
  }
  os << "\n";

  if (summary.cancelled) {
    os << verb << " cancelled\n";
  } else if (summary.success()) {
    os << "SUCCESS\n";
  } else {
    os << verb << " finished with " << summary.failed << " failure(s)\n";
  }
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(const config::SyncConfig& config, const ProgramOptions& options)
  : config_(config)
  , options_(options) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

int CLI::run() {
  try {
    return execute();
  }
  catch (const config::ConfigError& e) {
    log_and_display_error("Configuration error", e.what());
  }
  catch (const storage::StorageError& e) {
    log_and_display_error("Storage error", e.what());
  }
  catch (const sync::SyncError& e) {
    log_and_display_error("Sync error", e.what());
  }
  catch (const std::exception& e) {
    log_and_display_error("Unexpected error", e.what());
  }
  return EXIT_FAILED;
}

int CLI::execute() {
  auto store = storage::make_object_store(config_.storage, options_.bucket);
  fs::LocalFileSystem files;
  sync::CancellationToken token;
  sync::SyncController controller(config_, *store, files, token);

  // SIGINT and SIGTERM stop the dispatch of new transfers
  boost::asio::io_context signal_context;
  boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
  signals.async_wait([&token](const boost::system::error_code& ec, int signal_number) {
    if (!ec) {
      BOOST_LOG_TRIVIAL(warning) << "CLI: Received signal " << signal_number << ", cancelling";
      token.cancel();
    }
  });
  std::thread signal_thread([&signal_context]() { signal_context.run(); });

  sync::SyncSummary summary;
  try {
    summary = options_.command == Command::BACKUP
      ? controller.backup(options_.directory)
      : controller.restore(options_.directory);
  }
  catch (...) {
    signal_context.stop();
    signal_thread.join();
    throw;
  }

  signal_context.stop();
  signal_thread.join();

  print_summary(std::cout, summary, options_.command);
  return summary.success() ? EXIT_OK : EXIT_FAILED;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  std::cerr << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace bsync
