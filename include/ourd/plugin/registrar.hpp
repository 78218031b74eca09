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

#ifndef OURD_PLUGIN_REGISTRAR_HPP
#define OURD_PLUGIN_REGISTRAR_HPP

#include "ourd/api/handler.hpp"
#include "ourd/common.hpp"
#include "ourd/context/config.hpp"
#include "ourd/hooks.hpp"
#include "ourd/plugin/pool.hpp"

namespace ourd { namespace plugin {

/// Starts the configured plugins and installs what they declare in their handshake into the router
/// and the registries. Runs once, before the gateway starts.
class registrar_t {
    OURD_DECLARE_NONCOPYABLE(registrar_t)

    context_t& m_context;

    const std::shared_ptr<logging::logger_t> m_log;

    router_t& m_router;
    hook::registry_t& m_hooks;
    hook::lambdas_t& m_lambdas;
    hook::timers_t& m_timers;

    // Chains for actions which require the api key, nothing, or an authenticated user.
    const api::chain_t m_keyed;
    const api::chain_t m_open;
    const api::chain_t m_user;

public:
    registrar_t(context_t& context,
                router_t& router,
                hook::registry_t& hooks,
                hook::lambdas_t& lambdas,
                hook::timers_t& timers,
                api::chain_t keyed,
                api::chain_t open,
                api::chain_t user);

    /// Starts every plugin of the group. A plugin which fails to start is disabled and skipped, its
    /// pool is still returned.
    ///
    /// \throws std::system_error on a malformed plugin configuration or a duplicate registration.
    auto
    start(const config_t::component_map_t& plugins) -> std::vector<std::shared_ptr<pool_t>>;

    /// Starts one plugin with the given transport spawner.
    auto
    start(const descriptor_t& descriptor, pool_t::spawn_t spawn) -> std::shared_ptr<pool_t>;

    /// \throws std::system_error with error::duplicate_action, error::duplicate_lambda or
    /// error::duplicate_timer.
    void
    install(const std::shared_ptr<pool_t>& pool, const manifest_t& manifest);
};

}} // namespace ourd::plugin

#endif
