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

#include "ourd/plugin/pool.hpp"

#include "ourd/detail/loop.hpp"
#include "ourd/errors.hpp"
#include "ourd/logging.hpp"
#include "ourd/plugin/slave.hpp"

#include <asio/io_service.hpp>

#include <blackhole/logger.hpp>

using namespace ourd;
using namespace ourd::plugin;

// Lease

pool_t::lease_t::lease_t(pool_t* pool_, std::shared_ptr<slave_t> slave_):
    pool(pool_),
    slave(std::move(slave_))
{ }

pool_t::lease_t::lease_t(lease_t&& other):
    pool(other.pool),
    slave(std::move(other.slave))
{
    other.slave.reset();
}

pool_t::lease_t::~lease_t() {
    if(slave) {
        pool->checkin(std::move(slave));
    }
}

void
pool_t::lease_t::fail(const std::string& reason) {
    if(slave) {
        pool->discard(std::move(slave), reason);
        slave.reset();
    }
}

// Pool

pool_t::pool_t(descriptor_t descriptor, spawn_t spawn, std::unique_ptr<logging::logger_t> log):
    m_log(std::move(log)),
    m_descriptor(std::move(descriptor)),
    m_spawn(std::move(spawn)),
    m_counter(0),
    m_respawning(0),
    m_disabled(false),
    m_shutdown(false)
{
    m_stats.spawned = 0;
    m_stats.died    = 0;
    m_stats.calls   = 0;

    m_loop.reset(new io::loop_t(format("ourd/{}", m_descriptor.name)));
    m_spawner.reset(new io::loop_t(format("ourd/{}/spawn", m_descriptor.name)));
}

pool_t::~pool_t() {
    terminate();

    // Waits for the process terminators to finish.
    m_loop.reset();
}

auto
pool_t::start() -> manifest_t {
    OURD_LOG_INFO(m_log, "starting {} instance(s) of plugin '{}'", m_descriptor.pool, m_descriptor.path);

    std::pair<std::shared_ptr<slave_t>, manifest_t> first;

    try {
        first = spawn();
    } catch(const std::system_error& e) {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_disabled = true;

        OURD_LOG_ERROR(m_log, "plugin has failed to start and is disabled: {}", error::to_string(e));
        throw;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    first.first->migrate(slave_t::state_t::ready);

    m_slaves[first.first->id()] = first.first;
    m_ready.push_back(first.first);

    // The rest of the instances are started the same way the replacements are.
    for(size_t i = 1; i < m_descriptor.pool; ++i) {
        ++m_respawning;
        m_spawner->service().post(std::bind(&pool_t::respawn, this));
    }

    return first.second;
}

auto
pool_t::acquire(std::chrono::milliseconds timeout) -> lease_t {
    std::unique_lock<std::mutex> lock(m_mutex);

    const auto deadline = clock_type::now() + timeout;

    while(true) {
        if(m_shutdown) {
            throw error_t(error::pool_shutdown, "plugin '{}' is shutting down", m_descriptor.name);
        }

        if(m_disabled) {
            throw error_t(error::plugin_disabled, "plugin '{}' is disabled", m_descriptor.name);
        }

        while(!m_ready.empty()) {
            auto slave = m_ready.front();
            m_ready.pop_front();

            if(!slave->alive()) {
                bury(slave, "instance has been found dead");
                continue;
            }

            slave->migrate(slave_t::state_t::busy);

            return lease_t(this, std::move(slave));
        }

        if(clock_type::now() >= deadline) {
            throw error_t(error::pool_exhausted, "no instance of plugin '{}' has become ready within {} ms",
                m_descriptor.name, timeout.count());
        }

        m_ready_cv.wait_until(lock, deadline);
    }
}

auto
pool_t::call(const std::string& name, const dynamic_t& context) -> protocol::reply_t {
    auto lease = acquire(m_descriptor.timeout.acquire);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_stats.calls;
    }

    try {
        return lease->call(name, context, m_descriptor.timeout.call);
    } catch(const std::system_error& e) {
        lease.fail(e.what());
        throw;
    }
}

auto
pool_t::disabled() const -> bool {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_disabled;
}

auto
pool_t::info() const -> dynamic_t {
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t busy = 0;

    for(auto it = m_slaves.begin(); it != m_slaves.end(); ++it) {
        if(it->second->state() == slave_t::state_t::busy) {
            ++busy;
        }
    }

    const char* state = m_shutdown ? "stopped" : m_disabled ? "disabled" : "active";

    return dynamic_t::object_t{
        {"state", state},
        {"type",  m_descriptor.type},
        {"path",  m_descriptor.path},
        {"width", m_descriptor.pool},
        {"slaves", dynamic_t::object_t{
            {"ready",    m_ready.size()},
            {"busy",     busy},
            {"starting", m_respawning}
        }},
        {"spawned", m_stats.spawned},
        {"died",    m_stats.died},
        {"calls",   m_stats.calls}
    };
}

void
pool_t::terminate() {
    std::unique_ptr<io::loop_t> spawner;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if(m_shutdown) {
            return;
        }

        m_shutdown = true;
        m_ready_cv.notify_all();

        spawner = std::move(m_spawner);
    }

    OURD_LOG_INFO(m_log, "terminating plugin instances");

    // Waits for a replacement in progress, which will see the shutdown flag and drop its instance.
    spawner.reset();

    std::lock_guard<std::mutex> lock(m_mutex);

    for(auto it = m_slaves.begin(); it != m_slaves.end(); ++it) {
        it->second->terminate();
    }

    m_slaves.clear();
    m_ready.clear();
}

auto
pool_t::spawn() -> std::pair<std::shared_ptr<slave_t>, manifest_t> {
    uint64_t id;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = ++m_counter;
        ++m_stats.spawned;
    }

    auto slave = std::make_shared<slave_t>(id, m_spawn(m_loop->service()));

    try {
        auto manifest = manifest_t::from(slave->handshake(m_descriptor.timeout.handshake));

        OURD_LOG_INFO(m_log, "plugin instance {} has completed the handshake", slave->describe());

        return std::make_pair(slave, manifest);
    } catch(const std::system_error& e) {
        OURD_LOG_WARNING(m_log, "plugin instance {} has failed the handshake: {}", slave->describe(), e.what());

        slave->migrate(slave_t::state_t::dead);
        slave->terminate();

        throw;
    }
}

void
pool_t::respawn() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if(m_shutdown || m_disabled) {
            --m_respawning;
            return;
        }
    }

    std::shared_ptr<slave_t> slave;

    try {
        slave = spawn().first;
    } catch(const std::system_error& e) {
        std::lock_guard<std::mutex> lock(m_mutex);

        --m_respawning;

        OURD_LOG_ERROR(m_log, "unable to replace plugin instance: {}", error::to_string(e));

        ++m_stats.died;
        on_death();
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    --m_respawning;

    if(m_shutdown || m_disabled) {
        slave->migrate(slave_t::state_t::dead);
        slave->terminate();
        return;
    }

    slave->migrate(slave_t::state_t::ready);

    m_slaves[slave->id()] = slave;
    m_ready.push_back(slave);

    m_ready_cv.notify_one();
}

void
pool_t::checkin(std::shared_ptr<slave_t> slave) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if(!slave->alive()) {
        bury(slave, "instance has died while checked out");
        return;
    }

    if(m_shutdown) {
        slave->migrate(slave_t::state_t::dead);
        slave->terminate();
        return;
    }

    slave->migrate(slave_t::state_t::ready);

    m_ready.push_back(std::move(slave));
    m_ready_cv.notify_one();
}

void
pool_t::discard(std::shared_ptr<slave_t> slave, const std::string& reason) {
    std::lock_guard<std::mutex> lock(m_mutex);
    bury(slave, reason);
}

void
pool_t::bury(const std::shared_ptr<slave_t>& slave, const std::string& reason) {
    OURD_LOG_WARNING(m_log, "plugin instance {} is dead: {}", slave->describe(), reason);

    if(slave->state() != slave_t::state_t::dead) {
        slave->migrate(slave_t::state_t::dead);
    }

    slave->terminate();

    m_slaves.erase(slave->id());

    ++m_stats.died;

    if(!m_shutdown) {
        on_death();
    }
}

void
pool_t::on_death() {
    const auto now = clock_type::now();

    m_deaths.push_back(now);

    while(!m_deaths.empty() && now - m_deaths.front() > m_descriptor.respawn.window) {
        m_deaths.pop_front();
    }

    if(m_deaths.size() >= m_descriptor.respawn.limit) {
        if(!m_disabled) {
            OURD_LOG_ERROR(m_log, "plugin instances have died {} times within {} ms, disabling the plugin",
                m_deaths.size(), m_descriptor.respawn.window.count());
        }

        m_disabled = true;
        m_ready_cv.notify_all();
        return;
    }

    if(m_shutdown || !m_spawner) {
        return;
    }

    ++m_respawning;
    m_spawner->service().post(std::bind(&pool_t::respawn, this));
}
