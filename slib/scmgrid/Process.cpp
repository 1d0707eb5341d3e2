/*
 * SCMGrid: Gridded Runs of a Single Column Model
 * Copyright (c) 2026 by the SCMGrid developers
 * 
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * 
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 * 
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <scmgrid/Process.hpp>

namespace scmgrid {

static void close_fd(int &fd)
{
    if (fd >= 0) close(fd);
    fd = -1;
}

/** Reads everything available on fd into out.
@return false once the other end is closed. */
static bool drain(int fd, std::string &out)
{
    char buf[4096];
    for (;;) {
        ssize_t const n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno == EAGAIN) return true;
        return false;
    }
}

ProcessResult run_process(
    std::string const &cwd,
    std::string const &exe,
    std::vector<std::string> const &args)
{
    ProcessResult ret;

    // Build argv before fork(); the child may only make async-signal-safe calls
    std::vector<std::string> sargv;
    sargv.push_back(exe);
    sargv.insert(sargv.end(), args.begin(), args.end());
    std::vector<char *> argv;
    for (auto &s : sargv) argv.push_back(&s[0]);
    argv.push_back(nullptr);

    int out_fd[2] = {-1, -1};
    int err_fd[2] = {-1, -1};
    int exec_fd[2] = {-1, -1};     // Child reports a failed exec here
    if (pipe2(out_fd, O_CLOEXEC) != 0 || pipe2(err_fd, O_CLOEXEC) != 0
        || pipe2(exec_fd, O_CLOEXEC) != 0)
    {
        ret.launch = LaunchStatus::LAUNCH_FAILED;
        ret.launch_errno = errno;
        for (int *fd : {&out_fd[0], &out_fd[1], &err_fd[0], &err_fd[1], &exec_fd[0], &exec_fd[1]})
            close_fd(*fd);
        return ret;
    }

    pid_t const pid = fork();
    if (pid < 0) {
        ret.launch = LaunchStatus::LAUNCH_FAILED;
        ret.launch_errno = errno;
        for (int *fd : {&out_fd[0], &out_fd[1], &err_fd[0], &err_fd[1], &exec_fd[0], &exec_fd[1]})
            close_fd(*fd);
        return ret;
    }

    if (pid == 0) {
        // ----------- Child
        int err = 0;
        if (chdir(cwd.c_str()) != 0) err = errno;
        else if (dup2(out_fd[1], STDOUT_FILENO) < 0) err = errno;
        else if (dup2(err_fd[1], STDERR_FILENO) < 0) err = errno;
        else {
            execv(argv[0], &argv[0]);
            err = errno;
        }
        ssize_t const nw = write(exec_fd[1], &err, sizeof(err));
        (void)nw;
        _exit(127);
    }

    // ----------- Parent
    close_fd(out_fd[1]);
    close_fd(err_fd[1]);
    close_fd(exec_fd[1]);

    int child_errno = 0;
    ssize_t nread;
    do {
        nread = read(exec_fd[0], &child_errno, sizeof(child_errno));
    } while (nread < 0 && errno == EINTR);
    close_fd(exec_fd[0]);

    fcntl(out_fd[0], F_SETFL, O_NONBLOCK);
    fcntl(err_fd[0], F_SETFL, O_NONBLOCK);
    while (out_fd[0] >= 0 || err_fd[0] >= 0) {
        struct pollfd fds[2];
        fds[0].fd = out_fd[0];
        fds[0].events = POLLIN;
        fds[1].fd = err_fd[0];
        fds[1].events = POLLIN;
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (out_fd[0] >= 0 && fds[0].revents != 0 && !drain(out_fd[0], ret.out))
            close_fd(out_fd[0]);
        if (err_fd[0] >= 0 && fds[1].revents != 0 && !drain(err_fd[0], ret.err))
            close_fd(err_fd[0]);
    }
    close_fd(out_fd[0]);
    close_fd(err_fd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            if (nread <= 0) {
                ret.launch = LaunchStatus::LAUNCH_FAILED;
                ret.launch_errno = errno;
            }
            break;
        }
    }

    if (nread > 0) {
        // exec never happened
        ret.launch_errno = child_errno;
        switch(child_errno) {
            case ENOENT :
            case ENOTDIR :
                ret.launch = LaunchStatus::NOT_FOUND;
                break;
            case EACCES :
            case EPERM :
            case ENOEXEC :
                ret.launch = LaunchStatus::NOT_EXECUTABLE;
                break;
            default :
                ret.launch = LaunchStatus::LAUNCH_FAILED;
        }
        return ret;
    }

    if (WIFEXITED(status)) ret.exit_status = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) ret.exit_status = 128 + WTERMSIG(status);
    return ret;
}

}
