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

#ifndef OURD_EXEC_TRANSPORT_HPP
#define OURD_EXEC_TRANSPORT_HPP

#include "ourd/api/transport.hpp"

namespace ourd { namespace transport {

// Runs the plugin as a child process and talks to it over its stdin and stdout. Everything the
// plugin writes into its stderr is logged.

class exec_t:
    public api::transport_t
{
    class session_t;

    const std::unique_ptr<logging::logger_t> m_log;

    const std::string m_name;

    int m_pid;

    std::shared_ptr<session_t> m_session;

public:
    exec_t(context_t& context, asio::io_service& loop, const plugin::descriptor_t& descriptor);

    virtual
   ~exec_t();

    virtual
    plugin::protocol::reply_t
    call(const std::string& kind,
         const std::string& name,
         const dynamic_t& context,
         std::chrono::milliseconds timeout);

    virtual
    bool
    alive() const;

    virtual
    void
    terminate();

    virtual
    std::string
    id() const;
};

}} // namespace ourd::transport

#endif
