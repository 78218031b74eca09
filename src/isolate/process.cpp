/*
    Copyright (c) 2026 The Ourd Authors.

    This file is part of Ourd.

    Ourd is free software; you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.

    Ourd is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/

#include "ourd/detail/isolate/process.hpp"

#include "ourd/errors.hpp"
#include "ourd/logging.hpp"

#include <asio/deadline_timer.hpp>
#include <asio/io_service.hpp>

#include <blackhole/logger.hpp>

#include <boost/filesystem/operations.hpp>

#include <array>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ph = std::placeholders;

using namespace ourd;
using namespace ourd::isolate;

namespace fs = boost::filesystem;

namespace ourd { namespace isolate {

class process_terminator_t:
    public std::enable_shared_from_this<process_terminator_t>
{
public:
    const std::unique_ptr<logging::logger_t> log;

private:
    pid_t pid;

    struct {
        unsigned long kill;
        unsigned long gc;
    } timeout;

    asio::deadline_timer timer;

public:
    process_terminator_t(pid_t pid_,
                         unsigned long kill_timeout,
                         std::unique_ptr<logging::logger_t> log_,
                         asio::io_service& loop):
        log(std::move(log_)),
        pid(pid_),
        timer(loop)
    {
        timeout.kill = kill_timeout;
        timeout.gc   = 5;
    }

    ~process_terminator_t() {
        if(pid == 0) {
            return;
        }

        int status = 0;

        switch(::waitpid(pid, &status, WNOHANG)) {
        case -1:
            OURD_LOG_WARNING(log, "unable to properly collect the child: {}", std::strerror(errno));
            break;
        case 0:
            // The child is not finished yet, kill it and collect in a blocking way as as last resort
            // to prevent zombies.
            if(::kill(pid, SIGKILL) == 0) {
                if(::waitpid(pid, &status, 0) > 0) {
                    OURD_LOG_DEBUG(log, "child has been killed: {}", status);
                } else {
                    OURD_LOG_WARNING(log, "unable to properly collect the child: {}", std::strerror(errno));
                }
            } else {
                OURD_LOG_WARNING(log, "unable to send kill signal to the child: {}", std::strerror(errno));
            }
            break;
        default:
            OURD_LOG_DEBUG(log, "child has been collected: {}", status);
        }
    }

    void
    start() {
        int status = 0;

        // Attempt to collect the child non-blocking way.
        switch(::waitpid(pid, &status, WNOHANG)) {
        case -1:
            OURD_LOG_WARNING(log, "unable to collect the child: {}", std::strerror(errno));
            pid = 0;
            break;
        case 0:
            OURD_LOG_DEBUG(log, "child is still running, sending SIGTERM with {} sec timeout", timeout.kill);

            ::kill(pid, SIGTERM);

            timer.expires_from_now(boost::posix_time::seconds(timeout.kill));
            timer.async_wait(std::bind(&process_terminator_t::on_kill_timer, shared_from_this(), ph::_1));
            break;
        default:
            OURD_LOG_DEBUG(log, "child has exited: {}", status);
            pid = 0;
        }
    }

private:
    void
    on_kill_timer(const std::error_code& ec) {
        if(ec == asio::error::operation_aborted) {
            return;
        }

        int status = 0;

        switch(::waitpid(pid, &status, WNOHANG)) {
        case -1:
            OURD_LOG_WARNING(log, "unable to collect the child: {}", std::strerror(errno));
            pid = 0;
            break;
        case 0:
            OURD_LOG_DEBUG(log, "killing the child, resuming after {} sec", timeout.gc);

            ::kill(pid, SIGKILL);

            timer.expires_from_now(boost::posix_time::seconds(timeout.gc));
            timer.async_wait(std::bind(&process_terminator_t::on_gc_action, shared_from_this(), ph::_1));
            break;
        default:
            OURD_LOG_DEBUG(log, "child has been terminated: {}", status);
            pid = 0;
        }
    }

    void
    on_gc_action(const std::error_code& ec) {
        if(ec == asio::error::operation_aborted) {
            return;
        }

        int status = 0;

        switch(::waitpid(pid, &status, WNOHANG)) {
        case -1:
            OURD_LOG_WARNING(log, "unable to collect the child: {}", std::strerror(errno));
            pid = 0;
            break;
        case 0:
            OURD_LOG_DEBUG(log, "child has not been killed, resuming after {} sec", timeout.gc);

            timer.expires_from_now(boost::posix_time::seconds(timeout.gc));
            timer.async_wait(std::bind(&process_terminator_t::on_gc_action, shared_from_this(), ph::_1));
            break;
        default:
            OURD_LOG_DEBUG(log, "child has been killed: {}", status);
            pid = 0;
        }
    }
};

}} // namespace ourd::isolate

process_t::process_t(pid_t pid,
                     int input,
                     int output,
                     int errors,
                     unsigned long kill_timeout,
                     std::unique_ptr<logging::logger_t> log,
                     asio::io_service& loop):
    m_pid(pid),
    m_input(input),
    m_output(output),
    m_errors(errors),
    m_terminator(std::make_shared<process_terminator_t>(pid, kill_timeout, std::move(log), loop))
{
    OURD_LOG_DEBUG(m_terminator->log, "process has been spawned");
}

process_t::~process_t() = default;

void
process_t::terminate() {
    if(m_terminator) {
        m_terminator->start();
        m_terminator.reset();
    }
}

namespace {

typedef std::array<int, 2> pipe_t;

void
close_all(std::array<pipe_t, 3>& pipes) {
    for(auto it = pipes.begin(); it != pipes.end(); ++it) {
        for(auto fd = it->begin(); fd != it->end(); ++fd) {
            if(*fd >= 0) {
                ::close(*fd);
            }
        }
    }
}

} // namespace

std::unique_ptr<process_t>
ourd::isolate::spawn(const std::string& path,
                     const std::vector<std::string>& argv,
                     unsigned long kill_timeout,
                     std::unique_ptr<logging::logger_t> log,
                     asio::io_service& loop)
{
    if(path.find('/') != std::string::npos) {
        boost::system::error_code ec;

        if(!fs::is_regular_file(path, ec)) {
            throw error_t(error::spawn_failed, "executable '{}' does not exist", path);
        }
    }

    // Pipes for the child's stdin, stdout and stderr, in this order.
    std::array<pipe_t, 3> pipes;

    for(auto it = pipes.begin(); it != pipes.end(); ++it) {
        it->fill(-1);
    }

    for(auto it = pipes.begin(); it != pipes.end(); ++it) {
        if(::pipe(it->data()) != 0) {
            const int ec = errno;
            close_all(pipes);
            throw error_t(error::spawn_failed, "unable to create a pipe - {}", std::strerror(ec));
        }

        ::fcntl((*it)[0], F_SETFD, FD_CLOEXEC);
        ::fcntl((*it)[1], F_SETFD, FD_CLOEXEC);
    }

    const pid_t pid = ::fork();

    if(pid < 0) {
        const int ec = errno;
        close_all(pipes);
        throw error_t(error::spawn_failed, "unable to fork - {}", std::strerror(ec));
    }

    if(pid > 0) {
        ::close(pipes[0][0]);
        ::close(pipes[1][1]);
        ::close(pipes[2][1]);

        return std::unique_ptr<process_t>(new process_t(
            pid,
            pipes[0][1],
            pipes[1][0],
            pipes[2][0],
            kill_timeout,
            std::move(log),
            loop
        ));
    }

    // Child initialization

    ::dup2(pipes[0][0], STDIN_FILENO);
    ::dup2(pipes[1][1], STDOUT_FILENO);
    ::dup2(pipes[2][1], STDERR_FILENO);

    // Prepare the command line

    std::vector<char*> args = { ::strdup(path.c_str()) };

    for(auto it = argv.begin(); it != argv.end(); ++it) {
        args.push_back(::strdup(it->c_str()));
    }

    args.push_back(nullptr);

    // Unblock all the signals and restore the default dispositions

    sigset_t sigset;

    sigfillset(&sigset);

    ::sigprocmask(SIG_UNBLOCK, &sigset, nullptr);
    ::signal(SIGPIPE, SIG_DFL);

    if(::execvp(args[0], args.data()) != 0) {
        std::error_code ec(errno, std::system_category());
        std::cerr << ourd::format("unable to execute '{}' - [{}] {}", path, ec.value(), ec.message()) << std::endl;
    }

    std::_Exit(EXIT_FAILURE);
}
