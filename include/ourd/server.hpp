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

#ifndef OURD_SERVER_HPP
#define OURD_SERVER_HPP

#include "ourd/common.hpp"

#include <atomic>

namespace ourd {

/// Builds the router, the registries and the plugin pools from the context configuration, then
/// serves requests until a termination signal arrives.
class server_t {
    OURD_DECLARE_NONCOPYABLE(server_t)

    const std::unique_ptr<context_t> m_context;
    const std::unique_ptr<logging::logger_t> m_log;

    std::unique_ptr<router_t> m_router;

    std::unique_ptr<hook::registry_t> m_hooks;
    std::unique_ptr<hook::lambdas_t> m_lambdas;
    std::unique_ptr<hook::timers_t> m_timers;

    std::shared_ptr<api::storage_t> m_storage;
    std::shared_ptr<api::token_store_t> m_tokens;

    std::vector<std::shared_ptr<plugin::pool_t>> m_pools;

    std::unique_ptr<scheduler_t> m_scheduler;
    std::unique_ptr<gateway::http_t> m_gateway;

    std::atomic<bool> m_stopped;

public:
    /// Runs the whole registration phase. Plugins which fail to start are skipped.
    ///
    /// \throws std::system_error on a configuration error or a duplicate registration.
    explicit
    server_t(std::unique_ptr<context_t> context);

   ~server_t();

    auto
    router() const -> const router_t& {
        return *m_router;
    }

    /// Starts the scheduler and the gateway.
    void
    start();

    /// Stops accepting requests, drains the ones in flight and terminates the plugins.
    void
    stop();

    /// Starts the server and blocks until SIGINT, SIGTERM or SIGQUIT.
    void
    run();
};

} // namespace ourd

#endif
