/*
Copyright (c) 2025, 2026 acrion innovations GmbH
Authors: Stefan Zipproth, s.zipproth@acrion.ch

This file is part of nlterm.

nlterm is offered under a commercial and under the AGPL license.
For commercial licensing, contact us at https://acrion.ch/sales. For AGPL licensing, see below.

AGPL licensing:

nlterm is free software: you can redistribute it and/or modify
it under the terms of the GNU Affero General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

nlterm is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU Affero General Public License for more details.

You should have received a copy of the GNU Affero General Public License
along with nlterm. If not, see <https://www.gnu.org/licenses/>.
*/

#include "external_executor.hpp"
#include "stopwatch.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>

using namespace nlterm;
using namespace nlterm::console;

namespace
{
    // Reported through the status pipe when the child fails before or during exec.
    struct LaunchFailure
    {
        char stage; // 'd': chdir, 'e': exec
        int  error;
    };

    void close_fd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    void kill_group(pid_t pid)
    {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
            ;
    }

    int decode_status(int status)
    {
        if (WIFEXITED(status)) return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
        return 1;
    }
}

ExternalExecutor::ExternalExecutor(std::chrono::seconds timeout, Print print)
    : _timeout(timeout)
    , _print(std::move(print))
{
    if (_timeout <= std::chrono::seconds::zero() || _timeout > max_external_timeout)
    {
        throw std::invalid_argument("External command timeout must be between 1 and " + std::to_string(max_external_timeout.count()) + " seconds");
    }
}

CommandResult ExternalExecutor::run(const std::string&              name,
                                    const std::vector<std::string>& args,
                                    const std::filesystem::path&    cwd,
                                    const StringMap&                environment) const
{
    const std::string timed_out = "Command timed out after " + std::to_string(_timeout.count()) + " seconds";
    const auto        launch_error = [](const std::string& detail) -> CommandResult
    {
        return {"Error executing external command: " + detail, 1};
    };

    // Everything the child needs is prepared before fork, the child must not allocate.
    std::vector<const char*> argv;
    argv.push_back(name.c_str());
    for (const auto& arg : args)
    {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    env_strings.reserve(environment.size());
    for (const auto& [key, value] : environment)
    {
        env_strings.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : env_strings)
    {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const std::string directory = cwd.string();

    int out_pipe[2]    = {-1, -1};
    int err_pipe[2]    = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (::pipe2(out_pipe, O_CLOEXEC) < 0 || ::pipe2(err_pipe, O_CLOEXEC) < 0 || ::pipe2(status_pipe, O_CLOEXEC) < 0)
    {
        const std::string detail = std::string("pipe() failed: ") + std::strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &status_pipe[0], &status_pipe[1]})
        {
            close_fd(*fd);
        }
        return launch_error(detail);
    }

    if (_print) _print("Running external command '" + name + "' in " + directory, false);

    StopWatch watch;
    pid_t     pid = ::fork();

    if (pid < 0)
    {
        const std::string detail = std::string("fork() failed: ") + std::strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &status_pipe[0], &status_pipe[1]})
        {
            close_fd(*fd);
        }
        return launch_error(detail);
    }

    if (pid == 0)
    {
        // Child: own process group so that a timeout also terminates grandchildren.
        ::setpgid(0, 0);

        int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) ::dup2(null_fd, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        LaunchFailure failure{'d', 0};
        if (::chdir(directory.c_str()) == 0)
        {
            ::execvpe(name.c_str(), const_cast<char* const*>(argv.data()), envp.data());
            failure.stage = 'e';
        }
        failure.error = errno;
        ssize_t ignored = ::write(status_pipe[1], &failure, sizeof(failure));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe is closed by exec (O_CLOEXEC) or carries the reason why the launch failed.
    LaunchFailure failure{0, 0};
    ssize_t       got = 0;
    do
    {
        got = ::read(status_pipe[0], &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(failure)))
    {
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
            ;

        if (failure.stage == 'e' && (failure.error == ENOENT || failure.error == ENOTDIR))
        {
            if (_print) _print("Command not found: " + name, false);
            return {"Command not found: " + name, 127};
        }
        if (failure.stage == 'd')
        {
            return launch_error(std::string(std::strerror(failure.error)) + ": '" + directory + "'");
        }
        return launch_error(std::string(std::strerror(failure.error)) + ": '" + name + "'");
    }

    const std::chrono::milliseconds budget = _timeout;
    std::string    out_text;
    std::string    err_text;
    char           buffer[4096];

    while (out_pipe[0] >= 0 || err_pipe[0] >= 0)
    {
        if (watch.exceeded(budget))
        {
            close_fd(out_pipe[0]);
            close_fd(err_pipe[0]);
            kill_group(pid);
            if (_print) _print("External command '" + name + "' killed after " + watch.format(), false);
            return {timed_out, 1};
        }

        pollfd fds[2];
        nfds_t count = 0;
        for (int fd : {out_pipe[0], err_pipe[0]})
        {
            if (fd >= 0)
            {
                fds[count].fd      = fd;
                fds[count].events  = POLLIN;
                fds[count].revents = 0;
                ++count;
            }
        }

        int ready = ::poll(fds, count, static_cast<int>(watch.remaining(budget).count()));
        if (ready < 0)
        {
            if (errno == EINTR) continue;
            const std::string detail = std::string("poll() failed: ") + std::strerror(errno);
            close_fd(out_pipe[0]);
            close_fd(err_pipe[0]);
            kill_group(pid);
            return launch_error(detail);
        }

        for (nfds_t i = 0; i < count; ++i)
        {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            const bool is_out = fds[i].fd == out_pipe[0];
            ssize_t    n      = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0)
            {
                (is_out ? out_text : err_text).append(buffer, static_cast<size_t>(n));
            }
            else if (n == 0 || errno != EINTR)
            {
                close_fd(is_out ? out_pipe[0] : err_pipe[0]);
            }
        }
    }

    // Both streams are closed, the child may still be running.
    int status = 0;
    for (;;)
    {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0 && errno != EINTR)
        {
            return launch_error(std::string("waitpid() failed: ") + std::strerror(errno));
        }
        if (watch.exceeded(budget))
        {
            kill_group(pid);
            if (_print) _print("External command '" + name + "' killed after " + watch.format(), false);
            return {timed_out, 1};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    const int exit_code = decode_status(status);
    if (_print) _print("External command '" + name + "' exited with code " + std::to_string(exit_code) + " after " + watch.format(), false);

    return {out_text + err_text, exit_code};
}
