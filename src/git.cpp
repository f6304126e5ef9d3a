#include "lfscache/git.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace lfscache::git {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

std::string trim_newline(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

}  // namespace

CommandResult run(const std::vector<std::string>& args, const std::filesystem::path& cwd) {
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    }

    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back("git");
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // Child: never touch the parent's stdin (it may be the protocol stream)
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(126);
        execvp("git", argv.data());
        _exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    CommandResult result;
    pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&result.output, &result.error};
    int open_fds = 2;
    char buf[4096];
    while (open_fds > 0) {
        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (auto& f : fds) {
        if (f.fd >= 0) close(f.fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    if (WIFEXITED(status)) {
        result.exit_status = WEXITSTATUS(status);
    }
    if (result.exit_status == 127) {
        throw std::runtime_error("cannot execute git");
    }
    return result;
}

std::optional<std::filesystem::path> absolute_git_dir(const std::filesystem::path& cwd) {
    auto result = run({"rev-parse", "--absolute-git-dir"}, cwd);
    if (!result.ok()) return std::nullopt;
    auto dir = trim_newline(result.output);
    if (dir.empty()) return std::nullopt;
    return std::filesystem::path(dir);
}

std::vector<std::string> ConfigLocation::args() const {
    switch (scope) {
        case Scope::Default: return {};
        case Scope::System: return {"--system"};
        case Scope::Global: return {"--global"};
        case Scope::Local: return {"--local"};
        case Scope::Worktree: return {"--worktree"};
        case Scope::File: return {"--file", file.string()};
    }
    return {};
}

void set_config(const ConfigLocation& location, const std::string& key, const std::string& value,
                const std::filesystem::path& cwd) {
    std::vector<std::string> args = {"config"};
    auto loc = location.args();
    args.insert(args.end(), loc.begin(), loc.end());
    args.push_back(key);
    args.push_back(value);

    auto result = run(args, cwd);
    if (!result.ok()) {
        throw std::runtime_error("git config " + key + " failed: " + trim_newline(result.error));
    }
}

std::string shell_quote(const std::string& word) {
    if (!word.empty() &&
        word.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"
                               "0123456789-_./=:@,+") == std::string::npos) {
        return word;
    }
    std::string out = "'";
    for (char c : word) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

}  // namespace lfscache::git
