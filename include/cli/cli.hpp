#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "sync/types.hpp"

namespace bsync {
namespace cli {

enum class Command {
    NONE,
    BACKUP,
    RESTORE
};

// Exit status of the process
constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

struct ProgramOptions {
    Command command{Command::NONE};
    std::string directory;
    std::string bucket;

    // Overrides; unset values keep the configured ones
    std::string config_path;
    std::optional<std::size_t> workers;
    std::optional<std::string> prefix;
    std::optional<std::string> log_level;
    std::optional<std::string> backend;
    std::optional<std::string> fs_root;
    bool delete_stale{false};
    bool no_hash{false};
    bool verbose{false};

    bool help{false};
    bool valid{false};
    std::string error;
};

// Parses the arguments following the program name
ProgramOptions parse_command_line(const std::vector<std::string>& args);

void print_usage(std::ostream& os, const std::string& program_name);

// Applies command line overrides on top of a loaded configuration
void apply_overrides(const ProgramOptions& options, config::SyncConfig& config);

// Prints the final report: failed paths, rejected entries and a closing status line
void print_summary(std::ostream& os, const sync::SyncSummary& summary, Command command);


class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(const config::SyncConfig& config, const ProgramOptions& options);


    // ---- STARTUP ----
    // Runs the requested command and returns the process exit status
    int run();

private:
    // ---- PARAMETERS ----
    const config::SyncConfig& config_;
    const ProgramOptions& options_;


    // ---- COMMAND PROCESSING ----
    int execute();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace bsync
