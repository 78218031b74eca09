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

#ifndef OURD_PLUGIN_POOL_HPP
#define OURD_PLUGIN_POOL_HPP

#include "ourd/common.hpp"
#include "ourd/plugin/descriptor.hpp"
#include "ourd/plugin/protocol.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

namespace ourd { namespace plugin {

/// Fixed-width set of interchangeable instances of one plugin.
///
/// Every instance serves one call at a time, callers check instances out in FIFO order and return
/// them afterwards. Dead instances are replaced asynchronously until they die too often, at which
/// point the plugin is disabled.
class pool_t {
    OURD_DECLARE_NONCOPYABLE(pool_t)

public:
    typedef std::function<api::transport_ptr(asio::io_service&)> spawn_t;

    /// Checked out instance, returned to the pool on destruction.
    class lease_t {
        pool_t* pool;
        std::shared_ptr<slave_t> slave;

    public:
        lease_t(pool_t* pool, std::shared_ptr<slave_t> slave);
        lease_t(lease_t&& other);

       ~lease_t();

        lease_t(const lease_t&) = delete;
        lease_t& operator=(const lease_t&) = delete;

        auto
        operator->() const -> slave_t* {
            return slave.get();
        }

        /// Buries the instance instead of returning it.
        void
        fail(const std::string& reason);
    };

private:
    typedef std::chrono::steady_clock clock_type;

    const std::unique_ptr<logging::logger_t> m_log;
    const descriptor_t m_descriptor;
    const spawn_t m_spawn;

    // Event loop for the transports.
    std::unique_ptr<io::loop_t> m_loop;

    // Replacements are spawned here, since a handshake blocks until the transport loop replies.
    std::unique_ptr<io::loop_t> m_spawner;

    mutable std::mutex m_mutex;
    std::condition_variable m_ready_cv;

    std::map<uint64_t, std::shared_ptr<slave_t>> m_slaves;
    std::deque<std::shared_ptr<slave_t>> m_ready;

    // Recent deaths, for the respawn rate limit.
    std::deque<clock_type::time_point> m_deaths;

    uint64_t m_counter;
    size_t m_respawning;

    struct {
        uint64_t spawned;
        uint64_t died;
        uint64_t calls;
    } m_stats;

    bool m_disabled;
    bool m_shutdown;

public:
    pool_t(descriptor_t descriptor, spawn_t spawn, std::unique_ptr<logging::logger_t> log);
   ~pool_t();

    /// Spawns the instances. The first one is taken through the handshake synchronously and its
    /// reply is what the plugin contributes.
    ///
    /// \throws std::system_error if the first instance has failed to start. The plugin is disabled.
    auto
    start() -> manifest_t;

    /// Checks out the first ready instance, waiting up to the timeout for one to become ready.
    ///
    /// \throws std::system_error with error::pool_exhausted, error::plugin_disabled or
    /// error::pool_shutdown.
    auto
    acquire(std::chrono::milliseconds timeout) -> lease_t;

    /// Calls the plugin with the configured acquire and call timeouts. Remote errors are returned
    /// as replies; transport failures bury the instance and are rethrown.
    auto
    call(const std::string& name, const dynamic_t& context) -> protocol::reply_t;

    auto
    descriptor() const -> const descriptor_t& {
        return m_descriptor;
    }

    auto
    disabled() const -> bool;

    auto
    info() const -> dynamic_t;

    /// Stops replacing instances and terminates every one of them.
    void
    terminate();

private:
    auto
    spawn() -> std::pair<std::shared_ptr<slave_t>, manifest_t>;

    void
    respawn();

    void
    checkin(std::shared_ptr<slave_t> slave);

    void
    discard(std::shared_ptr<slave_t> slave, const std::string& reason);

    // Both expect the mutex to be held.
    void
    bury(const std::shared_ptr<slave_t>& slave, const std::string& reason);

    void
    on_death();
};

}} // namespace ourd::plugin

#endif
