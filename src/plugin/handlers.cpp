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

#include "ourd/plugin/handlers.hpp"

#include "ourd/errors.hpp"
#include "ourd/logging.hpp"
#include "ourd/plugin/pool.hpp"
#include "ourd/request.hpp"

#include <blackhole/logger.hpp>

#include <boost/lexical_cast.hpp>

using namespace ourd;
using namespace ourd::plugin;

namespace {

auto
principal(const request_t& request) -> dynamic_t {
    dynamic_t::object_t result = {
        {"kind", to_string(request.principal.kind)}
    };

    if(!request.principal.user_id.empty()) {
        result["user_id"] = request.principal.user_id;
    }

    return result;
}

} // namespace

void
ourd::plugin::fail(request_t& request, const dynamic_t& data) {
    if(!data.is_object()) {
        request.fail(error::remote_error, data.is_string() ?
            data.as_string() :
            boost::lexical_cast<std::string>(data));
        return;
    }

    const auto& object = data.as_object();
    const auto& message = object.at("message", dynamic_t::null);

    dynamic_t::object_t info;

    if(object.count("code")) {
        info["code"] = object.at("code");
    }

    if(object.count("info")) {
        info["info"] = object.at("info");
    }

    request.fail(
        error::remote_error,
        message.is_string() ? message.as_string() : std::string(),
        info.empty() ? dynamic_t() : dynamic_t(info)
    );
}

// Actions

action_t::action_t(std::shared_ptr<pool_t> pool, std::string name):
    m_pool(std::move(pool)),
    m_name(std::move(name))
{ }

dynamic_t
action_t::handle(request_t& request) {
    dynamic_t::object_t context = {
        {"action",    request.action},
        {"payload",   request.payload},
        {"principal", principal(request)}
    };

    if(!request.params.empty()) {
        dynamic_t::array_t params(request.params.begin(), request.params.end());
        context["params"] = params;
    }

    const auto reply = m_pool->call(m_name, context);

    if(reply.is_error()) {
        fail(request, reply.data);
        return dynamic_t::null;
    }

    return reply.data;
}

// Hooks

hook::invocable_t
ourd::plugin::make_hook(std::shared_ptr<pool_t> pool, std::string type, hook::trigger_t trigger, std::string name) {
    return [pool, type, trigger, name](request_t& request, dynamic_t& record) {
        const dynamic_t context = dynamic_t::object_t{
            {"record_type", type},
            {"trigger",     hook::to_string(trigger)},
            {"record",      record}
        };

        const auto reply = pool->call(name, context);

        if(reply.is_error()) {
            fail(request, reply.data);
            return;
        }

        if(hook::is_before(trigger) && reply.data.is_object()) {
            record = reply.data;
        }
    };
}

// Timers

std::function<void()>
ourd::plugin::make_timer(std::shared_ptr<pool_t> pool, std::string spec, std::string name,
                         std::shared_ptr<logging::logger_t> log)
{
    return [pool, spec, name, log]() {
        const auto reply = pool->call(name, dynamic_t::object_t{{"spec", spec}});

        if(reply.is_error()) {
            OURD_LOG_WARNING(log, "timer '{}' has returned an error: {}", name,
                boost::lexical_cast<std::string>(reply.data));
        }
    };
}
