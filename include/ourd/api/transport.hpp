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

#ifndef OURD_TRANSPORT_API_HPP
#define OURD_TRANSPORT_API_HPP

#include "ourd/common.hpp"
#include "ourd/plugin/protocol.hpp"
#include "ourd/repository.hpp"

#include <chrono>

namespace ourd { namespace api {

// Request/response channel to one running plugin instance. A transport carries at most one call at
// a time and assigns every message the next id of its session, starting with zero.

struct transport_t {
    typedef transport_t category_type;

    virtual
   ~transport_t() {
        // Empty.
    }

    /// Sends the message and blocks until the reply with the same id arrives.
    ///
    /// \throws std::system_error with error::call_timeout if the reply has not arrived in time, or
    /// with error::process_exited or error::protocol_violation. The transport is dead afterwards.
    virtual
    plugin::protocol::reply_t
    call(const std::string& kind,
         const std::string& name,
         const dynamic_t& context,
         std::chrono::milliseconds timeout) = 0;

    virtual
    bool
    alive() const = 0;

    /// Shuts the channel down and terminates the plugin instance.
    virtual
    void
    terminate() = 0;

    // Human-readable instance identity for diagnostics, e.g. its pid.
    virtual
    std::string
    id() const = 0;
};

typedef std::shared_ptr<transport_t> transport_ptr;

template<>
struct category_traits<transport_t> {
    typedef transport_ptr ptr_type;
    typedef std::function<ptr_type(context_t&, asio::io_service&, const plugin::descriptor_t&)> factory_type;

    static
    const char*
    name() {
        return "transport";
    }

    // Every call spawns a new plugin instance.
    template<class T>
    static
    factory_type
    make() {
        return [](context_t& context, asio::io_service& loop, const plugin::descriptor_t& descriptor) -> ptr_type {
            return std::make_shared<T>(context, loop, descriptor);
        };
    }
};

}} // namespace ourd::api

#endif
