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

#include "ourd/plugin/slave.hpp"

#include "ourd/errors.hpp"

#include <boost/lexical_cast.hpp>

using namespace ourd;
using namespace ourd::plugin;

auto
ourd::plugin::to_string(slave_t::state_t state) -> std::string {
    switch(state) {
    case slave_t::state_t::starting:
        return "starting";
    case slave_t::state_t::ready:
        return "ready";
    case slave_t::state_t::busy:
        return "busy";
    default:
        return "dead";
    }
}

slave_t::slave_t(uint64_t id, api::transport_ptr transport):
    m_id(id),
    m_transport(std::move(transport)),
    m_state(state_t::starting)
{ }

auto
slave_t::alive() const -> bool {
    return m_state != state_t::dead && m_transport->alive();
}

void
slave_t::migrate(state_t to) {
    bool valid = false;

    switch(m_state) {
    case state_t::starting:
        valid = to == state_t::ready || to == state_t::dead;
        break;
    case state_t::ready:
        valid = to == state_t::busy || to == state_t::dead;
        break;
    case state_t::busy:
        valid = to == state_t::ready || to == state_t::dead;
        break;
    case state_t::dead:
        break;
    }

    if(!valid) {
        throw error_t(error::invalid_transition, "slave {} can not migrate from {} to {}", m_id,
            to_string(m_state), to_string(to));
    }

    m_state = to;
}

auto
slave_t::handshake(std::chrono::milliseconds timeout) -> dynamic_t {
    protocol::reply_t reply;

    try {
        reply = m_transport->call(protocol::kind::init, protocol::kind::init, dynamic_t::null, timeout);
    } catch(const std::system_error& e) {
        if(e.code() == error::call_timeout) {
            throw error_t(error::handshake_timeout, "plugin has not completed the handshake within {} ms",
                timeout.count());
        }

        throw error_t(error::handshake_failed, "{}", e.what());
    }

    if(reply.is_error()) {
        throw error_t(error::handshake_failed, "plugin has rejected the handshake - {}",
            boost::lexical_cast<std::string>(reply.data));
    }

    return reply.data;
}

auto
slave_t::call(const std::string& name, const dynamic_t& context, std::chrono::milliseconds timeout) -> protocol::reply_t {
    return m_transport->call(protocol::kind::op, name, context, timeout);
}

void
slave_t::terminate() {
    m_transport->terminate();
}

auto
slave_t::describe() const -> std::string {
    return format("{} ({})", m_id, m_transport->id());
}
