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

#ifndef OURD_ISOLATE_PROCESS_HPP
#define OURD_ISOLATE_PROCESS_HPP

#include "ourd/common.hpp"

#include <sys/types.h>

namespace ourd { namespace isolate {

class process_terminator_t;

/// Spawned child process with its standard streams redirected into pipes.
///
/// The stream descriptors are owned by the caller, who is expected to hand them over to the event
/// loop. Terminating the process sends SIGTERM followed by SIGKILL after the kill timeout and
/// collects the child.
class process_t {
    OURD_DECLARE_NONCOPYABLE(process_t)

    const pid_t m_pid;

    const int m_input;
    const int m_output;
    const int m_errors;

    std::shared_ptr<process_terminator_t> m_terminator;

public:
    process_t(pid_t pid,
              int input,
              int output,
              int errors,
              unsigned long kill_timeout,
              std::unique_ptr<logging::logger_t> log,
              asio::io_service& loop);

   ~process_t();

    auto
    pid() const -> pid_t {
        return m_pid;
    }

    // Child's stdin, the parent writes into it.
    auto
    input() const -> int {
        return m_input;
    }

    auto
    output() const -> int {
        return m_output;
    }

    auto
    errors() const -> int {
        return m_errors;
    }

    /// Starts the termination sequence. Must be called from the event loop thread.
    void
    terminate();
};

/// Forks and executes the program. The path is searched in PATH if it has no slashes.
///
/// \throws std::system_error with error::spawn_failed.
std::unique_ptr<process_t>
spawn(const std::string& path,
      const std::vector<std::string>& argv,
      unsigned long kill_timeout,
      std::unique_ptr<logging::logger_t> log,
      asio::io_service& loop);

}} // namespace ourd::isolate

#endif
