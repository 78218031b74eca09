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

#include "ourd/detail/handlers.hpp"

#include "ourd/plugin/pool.hpp"
#include "ourd/router.hpp"

using namespace ourd;
using namespace ourd::handler;

dynamic_t
home_t::handle(request_t& /* request */) {
    return dynamic_t::object_t{{"status", "OK"}};
}

info_t::info_t(const router_t& router,
               const hook::registry_t& hooks,
               const hook::lambdas_t& lambdas,
               const hook::timers_t& timers,
               const std::vector<std::shared_ptr<plugin::pool_t>>& pools):
    m_router(router),
    m_hooks(hooks),
    m_lambdas(lambdas),
    m_timers(timers),
    m_pools(pools)
{ }

dynamic_t
info_t::handle(request_t& /* request */) {
    dynamic_t::object_t plugins;

    for(auto it = m_pools.begin(); it != m_pools.end(); ++it) {
        plugins[(*it)->descriptor().name] = (*it)->info();
    }

    const auto actions = m_router.actions();
    const auto lambdas = m_lambdas.names();

    dynamic_t::array_t timers;

    for(auto it = m_timers.all().begin(); it != m_timers.all().end(); ++it) {
        timers.push_back(dynamic_t::object_t{{"name", it->name}, {"spec", it->spec}});
    }

    return dynamic_t::object_t{
        {"plugins", plugins},
        {"actions", dynamic_t::array_t(actions.begin(), actions.end())},
        {"hooks",   m_hooks.info()},
        {"lambdas", dynamic_t::array_t(lambdas.begin(), lambdas.end())},
        {"timers",  timers}
    };
}
