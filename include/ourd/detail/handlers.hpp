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

#ifndef OURD_HANDLERS_HPP
#define OURD_HANDLERS_HPP

#include "ourd/api/handler.hpp"
#include "ourd/hooks.hpp"

namespace ourd { namespace handler {

// Bound to the empty action.

class home_t:
    public api::handler_t
{
public:
    virtual
    dynamic_t
    handle(request_t& request);
};

// Reports the plugins and everything they have registered.

class info_t:
    public api::handler_t
{
    const router_t& m_router;
    const hook::registry_t& m_hooks;
    const hook::lambdas_t& m_lambdas;
    const hook::timers_t& m_timers;

    // Filled by the registrar after this handler has been registered.
    const std::vector<std::shared_ptr<plugin::pool_t>>& m_pools;

public:
    info_t(const router_t& router,
           const hook::registry_t& hooks,
           const hook::lambdas_t& lambdas,
           const hook::timers_t& timers,
           const std::vector<std::shared_ptr<plugin::pool_t>>& pools);

    virtual
    dynamic_t
    handle(request_t& request);
};

}} // namespace ourd::handler

#endif
