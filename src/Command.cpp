/**
 * @file Command.cpp
 * @brief Child process execution
 */

#include "routerkit/Command.hpp"
#include "routerkit/Errors.hpp"
#include "routerkit/Util.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace routerkit {

namespace {
    void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    // Returns false once the descriptor reached EOF
    bool drain(int fd, std::string& sink) {
        char buffer[4096];
        for (;;) {
            const ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                sink.append(buffer, static_cast<size_t>(n));
                return true;
            }
            if (n == 0) {
                return false;
            }
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
    }
}

Value CommandResult::to_json() const {
    Value j = {
        {"returncode", returncode},
        {"results", results},
        {"cmd", cmd}
    };
    if (!ok() || decode_error) {
        j["stdout"] = stdout_text;
        j["stderr"] = stderr_text;
    }
    if (decode_error) {
        j["err"] = *decode_error;
    }
    return j;
}

std::string join_command(const std::vector<std::string>& argv) {
    return join(argv, " ");
}

ProcessOutput ProcessRunner::run(const std::vector<std::string>& argv,
                                 const std::map<std::string, std::string>& env) {
    const std::string cmd = join_command(argv);
    if (argv.empty()) {
        throw CollaboratorError(cmd, -1, "missing command");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe(out_pipe) != 0) {
        throw CollaboratorError(cmd, -1, std::string("pipe failed: ") + std::strerror(errno));
    }
    if (::pipe(err_pipe) != 0) {
        const int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        throw CollaboratorError(cmd, -1, std::string("pipe failed: ") + std::strerror(saved));
    }

    std::vector<char*> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargs.push_back(const_cast<char*>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid == 0) {
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);

        for (const auto& [name, value] : env) {
            ::setenv(name.c_str(), value.c_str(), 1);
        }
        ::execvp(cargs[0], cargs.data());
        _exit(127);
    }

    if (pid < 0) {
        const int saved = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        throw CollaboratorError(cmd, -1, std::string("fork failed: ") + std::strerror(saved));
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    ProcessOutput output;
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];

    while (out_fd >= 0 || err_fd >= 0) {
        pollfd fds[2];
        nfds_t count = 0;
        if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};

        if (::poll(fds, count, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }
            if (fds[i].fd == out_fd && !drain(out_fd, output.out)) {
                close_fd(out_fd);
            } else if (fds[i].fd == err_fd && !drain(err_fd, output.err)) {
                close_fd(err_fd);
            }
        }
    }
    close_fd(out_fd);
    close_fd(err_fd);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw CollaboratorError(cmd, -1, std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exit_code = 128 + WTERMSIG(status);
    } else {
        output.exit_code = -1;
    }
    return output;
}

} // namespace routerkit
