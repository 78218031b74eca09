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

#include "ourd/server.hpp"

#include "ourd/api/storage.hpp"
#include "ourd/api/token_store.hpp"
#include "ourd/context.hpp"
#include "ourd/context/config.hpp"
#include "ourd/detail/gateway/http.hpp"
#include "ourd/detail/handlers.hpp"
#include "ourd/detail/preprocessors.hpp"
#include "ourd/hooks.hpp"
#include "ourd/logging.hpp"
#include "ourd/plugin/pool.hpp"
#include "ourd/plugin/registrar.hpp"
#include "ourd/router.hpp"
#include "ourd/scheduler.hpp"

#include <asio/io_service.hpp>
#include <asio/signal_set.hpp>

#include <blackhole/logger.hpp>

#include <csignal>

using namespace ourd;

server_t::server_t(std::unique_ptr<context_t> context):
    m_context(std::move(context)),
    m_log(m_context->log("server")),
    m_stopped(false)
{
    const auto& config = m_context->config();

    m_router.reset(new router_t(m_context->log("router")));
    m_hooks.reset(new hook::registry_t(m_context->log("hooks")));
    m_lambdas.reset(new hook::lambdas_t());
    m_timers.reset(new hook::timers_t());

    OURD_LOG_INFO(m_log, "opening '{}' storage", config.storage.type);

    m_storage = m_context->repository().get<api::storage_t>(config.storage.type, *m_context, "core",
        config.storage.args);

    OURD_LOG_INFO(m_log, "opening '{}' token store", config.token_store.type);

    m_tokens = m_context->repository().get<api::token_store_t>(config.token_store.type, *m_context, "core",
        config.token_store.args);

    const auto tokens        = std::make_shared<preprocessor::tokens_t>(m_tokens);
    const auto authenticator = std::make_shared<preprocessor::authenticator_t>(config.app);
    const auto connection    = std::make_shared<preprocessor::connection_t>(m_storage);
    const auto hooks         = std::make_shared<preprocessor::hooks_t>(*m_hooks);
    const auto master        = std::make_shared<preprocessor::require_master_t>();
    const auto user          = std::make_shared<preprocessor::require_user_t>();

    const api::chain_t keyed   = {tokens, authenticator, connection, hooks};
    const api::chain_t unkeyed = {connection, hooks};
    const api::chain_t users   = {tokens, authenticator, connection, hooks, user};

    // Native actions.

    m_router->insert("", std::make_shared<handler::home_t>(), api::chain_t());
    m_router->insert("plugin:info",
        std::make_shared<handler::info_t>(*m_router, *m_hooks, *m_lambdas, *m_timers, m_pools),
        api::chain_t{tokens, authenticator, master});

    // Plugins.

    plugin::registrar_t registrar(*m_context, *m_router, *m_hooks, *m_lambdas, *m_timers, keyed, unkeyed,
        users);

    m_pools = registrar.start(config.plugins);

    // Registration is over, everything is read-only from now on.
    m_router->seal();
    m_hooks->seal();
    m_lambdas->seal();
    m_timers->seal();

    m_scheduler.reset(new scheduler_t(*m_timers, m_context->log("scheduler")));
}

server_t::~server_t() {
    stop();
}

void
server_t::start() {
    const auto& config = m_context->config();

    m_scheduler->start();

    m_gateway.reset(new gateway::http_t(*m_context, *m_router, config.http));
    m_gateway->start();

    OURD_LOG_INFO(m_log, "'{}' is serving on {}:{}", config.app.name, config.http.endpoint,
        config.http.port);
}

void
server_t::stop() {
    if(m_stopped.exchange(true)) {
        return;
    }

    OURD_LOG_INFO(m_log, "stopping the server");

    if(m_gateway) {
        m_gateway->stop(m_context->config().http.drain_timeout);
    }

    m_scheduler->stop();

    // Calls still running past the drain timeout fail as soon as their pools are gone.
    for(auto it = m_pools.begin(); it != m_pools.end(); ++it) {
        (*it)->terminate();
    }

    if(m_gateway) {
        m_gateway->join();
    }

    OURD_LOG_INFO(m_log, "server has been stopped");
}

void
server_t::run() {
    asio::io_service loop;
    asio::signal_set signals(loop, SIGINT, SIGTERM, SIGQUIT);

    signals.async_wait([&](const std::error_code& ec, int signum) {
        if(!ec) {
            OURD_LOG_INFO(m_log, "caught signal {}, shutting down", signum);
        }
    });

    start();

    loop.run();

    stop();
}
