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

#ifndef OURD_PLUGIN_SLAVE_HPP
#define OURD_PLUGIN_SLAVE_HPP

#include "ourd/api/transport.hpp"
#include "ourd/common.hpp"

#include <chrono>

namespace ourd { namespace plugin {

/// One plugin instance, owned by its pool.
///
/// Lifecycle: starting -> ready (handshake succeeded) -> busy (checked out) -> ready (checked in) or
/// dead (timeout, protocol violation, write failure or exit). A dead slave never comes back.
class slave_t {
    OURD_DECLARE_NONCOPYABLE(slave_t)

public:
    enum class state_t {
        starting,
        ready,
        busy,
        dead
    };

private:
    const uint64_t m_id;
    const api::transport_ptr m_transport;

    // Guarded by the owning pool.
    state_t m_state;

public:
    slave_t(uint64_t id, api::transport_ptr transport);

    auto
    id() const -> uint64_t {
        return m_id;
    }

    auto
    state() const -> state_t {
        return m_state;
    }

    auto
    alive() const -> bool;

    /// \throws std::system_error with error::invalid_transition.
    void
    migrate(state_t to);

    /// Sends the "init" message.
    ///
    /// \returns the handshake reply data.
    /// \throws std::system_error with error::handshake_timeout or error::handshake_failed.
    auto
    handshake(std::chrono::milliseconds timeout) -> dynamic_t;

    auto
    call(const std::string& name, const dynamic_t& context, std::chrono::milliseconds timeout) -> protocol::reply_t;

    void
    terminate();

    auto
    describe() const -> std::string;
};

auto
to_string(slave_t::state_t state) -> std::string;

}} // namespace ourd::plugin

#endif
