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

#ifndef OURD_PLUGIN_HANDLERS_HPP
#define OURD_PLUGIN_HANDLERS_HPP

#include "ourd/api/handler.hpp"
#include "ourd/hooks.hpp"

namespace ourd { namespace plugin {

// Plugin-backed action or lambda. The plugin receives {"action", "payload", "principal"} and its
// result becomes the handler result.

class action_t:
    public api::handler_t
{
    const std::shared_ptr<pool_t> m_pool;
    const std::string m_name;

public:
    action_t(std::shared_ptr<pool_t> pool, std::string name);

    virtual
    dynamic_t
    handle(request_t& request);
};

// The plugin receives {"record_type", "trigger", "record"}. An object returned by a before-* hook
// replaces the record.
hook::invocable_t
make_hook(std::shared_ptr<pool_t> pool, std::string type, hook::trigger_t trigger, std::string name);

// The plugin receives {"spec"}.
std::function<void()>
make_timer(std::shared_ptr<pool_t> pool, std::string spec, std::string name, std::shared_ptr<logging::logger_t> log);

/// Fails the request with the error carried by a plugin reply.
void
fail(request_t& request, const dynamic_t& data);

}} // namespace ourd::plugin

#endif
