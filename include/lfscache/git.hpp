#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lfscache::git {

struct CommandResult {
    int exit_status = -1;
    std::string output;  // stdout
    std::string error;   // stderr
    bool ok() const { return exit_status == 0; }
};

/// Run `git <args...>` in `cwd` and capture its output. Throws
/// std::runtime_error if git cannot be started.
CommandResult run(const std::vector<std::string>& args, const std::filesystem::path& cwd = {});

/// `git rev-parse --absolute-git-dir`, or nullopt outside a repository.
std::optional<std::filesystem::path> absolute_git_dir(const std::filesystem::path& cwd = {});

/// Which config file `git config` writes to.
struct ConfigLocation {
    enum class Scope { Default, System, Global, Local, Worktree, File };
    Scope scope = Scope::Default;
    std::filesystem::path file;  // Scope::File

    std::vector<std::string> args() const;
};

/// `git config [location] <key> <value>`. Throws std::runtime_error with git's
/// stderr on failure.
void set_config(const ConfigLocation& location, const std::string& key, const std::string& value,
                const std::filesystem::path& cwd = {});

/// Quote one word for a POSIX shell (git-lfs splits `args` with shell rules).
std::string shell_quote(const std::string& word);

}  // namespace lfscache::git
