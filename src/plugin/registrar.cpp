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

#include "ourd/plugin/registrar.hpp"

#include "ourd/api/transport.hpp"
#include "ourd/context.hpp"
#include "ourd/errors.hpp"
#include "ourd/logging.hpp"
#include "ourd/plugin/handlers.hpp"
#include "ourd/router.hpp"
#include "ourd/scheduler.hpp"

#include <blackhole/logger.hpp>

using namespace ourd;
using namespace ourd::plugin;

registrar_t::registrar_t(context_t& context,
                         router_t& router,
                         hook::registry_t& hooks,
                         hook::lambdas_t& lambdas,
                         hook::timers_t& timers,
                         api::chain_t keyed,
                         api::chain_t open,
                         api::chain_t user):
    m_context(context),
    m_log(context.log("plugin/registrar")),
    m_router(router),
    m_hooks(hooks),
    m_lambdas(lambdas),
    m_timers(timers),
    m_keyed(std::move(keyed)),
    m_open(std::move(open)),
    m_user(std::move(user))
{ }

auto
registrar_t::start(const config_t::component_map_t& plugins) -> std::vector<std::shared_ptr<pool_t>> {
    std::vector<descriptor_t> descriptors;

    // Validate everything before spawning anything.
    for(auto it = plugins.begin(); it != plugins.end(); ++it) {
        auto descriptor = descriptor_t::from(it->first, it->second);

        if(!m_context.repository().contains<api::transport_t>(descriptor.type)) {
            throw error_t(error::component_not_found, "plugin '{}' transport '{}' is not available", it->first,
                descriptor.type);
        }

        descriptors.push_back(std::move(descriptor));
    }

    std::vector<std::shared_ptr<pool_t>> pools;

    for(auto it = descriptors.begin(); it != descriptors.end(); ++it) {
        context_t& context = m_context;
        const descriptor_t descriptor = *it;

        pools.push_back(start(descriptor, [&context, descriptor](asio::io_service& loop) -> api::transport_ptr {
            return context.repository().get<api::transport_t>(descriptor.type, context, loop, descriptor);
        }));
    }

    return pools;
}

auto
registrar_t::start(const descriptor_t& descriptor, pool_t::spawn_t spawn) -> std::shared_ptr<pool_t> {
    auto pool = std::make_shared<pool_t>(
        descriptor,
        std::move(spawn),
        m_context.log(format("plugin/{}", descriptor.name))
    );

    manifest_t manifest;

    try {
        manifest = pool->start();
    } catch(const std::system_error& e) {
        OURD_LOG_ERROR(m_log, "plugin '{}' is disabled, continuing without it: {}", descriptor.name,
            error::to_string(e));
        return pool;
    }

    install(pool, manifest);

    OURD_LOG_INFO(m_log, "plugin '{}' has registered {} handler(s), {} hook(s), {} lambda(s), {} timer(s)",
        descriptor.name, manifest.handlers.size(), manifest.hooks.size(), manifest.lambdas.size(),
        manifest.timers.size());

    return pool;
}

void
registrar_t::install(const std::shared_ptr<pool_t>& pool, const manifest_t& manifest) {
    const auto& plugin = pool->descriptor().name;

    for(auto it = manifest.handlers.begin(); it != manifest.handlers.end(); ++it) {
        const auto& chain = it->user_required ? m_user : it->key_required ? m_keyed : m_open;

        m_router.insert(it->name, std::make_shared<action_t>(pool, it->name), chain);
    }

    for(auto it = manifest.hooks.begin(); it != manifest.hooks.end(); ++it) {
        const auto trigger = hook::trigger_from_string(it->trigger);

        m_hooks.insert(it->type, trigger, format("{}:{}", plugin, it->name),
            make_hook(pool, it->type, trigger, it->name));
    }

    for(auto it = manifest.lambdas.begin(); it != manifest.lambdas.end(); ++it) {
        auto lambda = std::make_shared<action_t>(pool, *it);

        m_lambdas.insert(*it, lambda);
        m_router.insert(*it, lambda, m_keyed);
    }

    for(auto it = manifest.timers.begin(); it != manifest.timers.end(); ++it) {
        m_timers.insert(it->spec, it->name, make_timer(pool, it->spec, it->name, m_log));
    }
}
