#include "lfscache/agent_config.hpp"
#include "lfscache/constants.hpp"
#include "lfscache/git.hpp"
#include "lfscache/logging.hpp"
#include "lfscache/transfer_agent.hpp"
#include "lfscache/transfer_log.hpp"

#include <csignal>
#include <iostream>
#include <string>
#include <unistd.h>

namespace {

void print_usage() {
    std::cerr <<
        "Usage: lfs-cache <command> [options]\n"
        "\n"
        "Commands:\n"
        "  transfer-agent   Serve the git-lfs custom transfer protocol on stdin/stdout\n"
        "  install          Register this binary as a git-lfs custom transfer agent\n"
        "  stats            Summarize transfer logs (cache hits and misses)\n"
        "\n"
        "Run `lfs-cache <command> --help` for command options.\n";
}

bool is_secret_param(const std::string& key) {
    return key.find("key") != std::string::npos || key.find("secret") != std::string::npos ||
           key.find("token") != std::string::npos || key.find("credential") != std::string::npos;
}

/// Resolve git_dir from the working directory when it was not given.
void discover_git_dir(lfscache::AgentConfig& config) {
    if (!config.git_dir.empty()) return;
    try {
        if (auto dir = lfscache::git::absolute_git_dir()) {
            config.git_dir = *dir;
            config.apply_defaults();
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: " << e.what() << "\n";
    }
}

// --- transfer-agent ---

int cmd_transfer_agent(int argc, char* argv[]) {
    auto config_opt = lfscache::AgentConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);
    discover_git_dir(config);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // stdout carries the protocol; everything else goes to the log file
    if (config.log_file.empty() && !config.logs_dir.empty()) {
        config.log_file = config.logs_dir / (lfscache::run_file_stem() + ".log");
    }
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.log_file.parent_path(), ec);
        if (!lfscache::redirect_log(config.log_file)) {
            std::cerr << "Warning: cannot open log file " << config.log_file << "\n";
        }
    }
    lfscache::set_log_verbose(config.verbose);

    // The host may close our stdout early; report that as a write error
    std::signal(SIGPIPE, SIG_IGN);

    lfscache::log_info("lfs-cache transfer agent starting (PID %d)", static_cast<int>(getpid()));
    lfscache::log_info("  git-dir: %s", config.git_dir.c_str());
    lfscache::log_info("  temp-dir: %s", config.temp_dir.c_str());
    lfscache::log_info("  logs-dir: %s", config.logs_dir.c_str());
    if (config.cache.empty()) {
        lfscache::log_info("  cache: (none)");
    } else {
        lfscache::log_info("  cache-type: %s", config.cache.type.c_str());
        for (auto& [k, v] : config.cache.params) {
            lfscache::log_info("  cache-%s: %s", k.c_str(),
                               is_secret_param(k) ? "****" : v.c_str());
        }
    }
    lfscache::log_info("  default-concurrency: %zu", config.default_concurrency);
    lfscache::log_info("  max-retries: %zu", config.backoff.max_retries);
    if (!config.metrics_file.empty()) {
        lfscache::log_info("  metrics-file: %s (every %zus)", config.metrics_file.c_str(),
                           config.metrics_interval_secs);
    }

    return lfscache::run_transfer_agent(config, std::cin, std::cout);
}

// --- install ---

int cmd_install(int argc, char* argv[]) {
    lfscache::git::ConfigLocation location;
    lfscache::BackendConfig cache;
    std::string direction = "both";
    std::string concurrent = "true";
    int scopes = 0;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };
    using Scope = lfscache::git::ConfigLocation::Scope;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--system") {
            location.scope = Scope::System;
            ++scopes;
        } else if (arg == "--global") {
            location.scope = Scope::Global;
            ++scopes;
        } else if (arg == "--local") {
            location.scope = Scope::Local;
            ++scopes;
        } else if (arg == "--worktree") {
            location.scope = Scope::Worktree;
            ++scopes;
        } else if (arg == "--file") {
            auto* v = next_arg(i, "--file");
            if (!v) return 1;
            location.scope = Scope::File;
            location.file = v;
            ++scopes;
        } else if (arg == "--cache") {
            auto* v = next_arg(i, "--cache");
            if (!v) return 1;
            std::string error;
            auto backend = lfscache::BackendConfig::from_json(v, error);
            if (!backend) {
                std::cerr << "Error: --cache: " << error << "\n";
                return 1;
            }
            auto verr = backend->validate();
            if (!verr.empty()) {
                std::cerr << "Error: --cache: " << verr << "\n";
                return 1;
            }
            cache = std::move(*backend);
        } else if (arg == "--direction") {
            auto* v = next_arg(i, "--direction");
            if (!v) return 1;
            direction = v;
            if (direction != "download" && direction != "upload" && direction != "both") {
                std::cerr << "Error: --direction must be download, upload or both\n";
                return 1;
            }
        } else if (arg == "--concurrent") {
            auto* v = next_arg(i, "--concurrent");
            if (!v) return 1;
            concurrent = v;
            if (concurrent != "true" && concurrent != "false") {
                std::cerr << "Error: --concurrent must be true or false\n";
                return 1;
            }
        } else if (arg == "--help" || arg == "-h") {
            std::cerr <<
                "Usage: lfs-cache install [options]\n"
                "\n"
                "Config location (at most one, default: git's default):\n"
                "  --system | --global | --local | --worktree | --file <path>\n"
                "\n"
                "Agent:\n"
                "  --cache <json>         Cache backend passed to transfer-agent\n"
                "  --direction <dir>      download, upload or both (default: both)\n"
                "  --concurrent <bool>    Let git-lfs run transfers concurrently (default: true)\n";
            return 1;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return 1;
        }
    }
    if (scopes > 1) {
        std::cerr << "Error: choose at most one config location\n";
        return 1;
    }

    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        std::cerr << "Error: cannot resolve own executable path: " << ec.message() << "\n";
        return 1;
    }

    std::string agent_args = "transfer-agent";
    if (!cache.empty()) {
        agent_args += " --cache " + lfscache::git::shell_quote(cache.to_json());
    }

    const std::string prefix = std::string("lfs.customtransfer.") + lfscache::constants::AGENT_NAME;
    try {
        lfscache::git::set_config(location, prefix + ".path", self.string());
        lfscache::git::set_config(location, prefix + ".args", agent_args);
        lfscache::git::set_config(location, prefix + ".direction", direction);
        lfscache::git::set_config(location, prefix + ".concurrent", concurrent);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Installed " << lfscache::constants::AGENT_NAME << " (" << self.string()
              << ") as git-lfs custom transfer agent\n";
    return 0;
}

// --- stats ---

int cmd_stats(int argc, char* argv[]) {
    std::filesystem::path logs_dir;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--logs-dir" && i + 1 < argc) {
            logs_dir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: lfs-cache stats [--logs-dir <path>]\n";
            return 1;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (logs_dir.empty()) {
        lfscache::AgentConfig config;
        discover_git_dir(config);
        if (config.logs_dir.empty()) {
            std::cerr << "Error: not in a git repository; pass --logs-dir\n";
            return 1;
        }
        logs_dir = config.logs_dir;
    }

    auto report = lfscache::summarize_transfer_logs(logs_dir);
    std::cout << report.format();
    if (report.malformed_lines > 0) {
        std::cerr << "Warning: skipped " << report.malformed_lines << " malformed log lines\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    if (command == "transfer-agent") return cmd_transfer_agent(argc - 1, argv + 1);
    if (command == "install") return cmd_install(argc - 1, argv + 1);
    if (command == "stats") return cmd_stats(argc - 1, argv + 1);
    if (command == "--version") {
        std::cout << lfscache::constants::USER_AGENT << "\n";
        return 0;
    }

    print_usage();
    return command == "--help" || command == "-h" ? 0 : 1;
}
