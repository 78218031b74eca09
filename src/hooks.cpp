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

#include "ourd/hooks.hpp"

#include "ourd/errors.hpp"
#include "ourd/logging.hpp"
#include "ourd/request.hpp"

#include <blackhole/logger.hpp>

using namespace ourd;
using namespace ourd::hook;

namespace {

const std::map<std::string, trigger_t> triggers = {
    {"before-save",   trigger_t::before_save  },
    {"after-save",    trigger_t::after_save   },
    {"before-delete", trigger_t::before_delete},
    {"after-delete",  trigger_t::after_delete }
};

void
check_sealed(bool sealed) {
    if(sealed) {
        throw error_t(error::registry_sealed, "unable to register hooks after startup");
    }
}

} // namespace

auto
ourd::hook::trigger_from_string(const std::string& name) -> trigger_t {
    auto it = triggers.find(name);

    if(it == triggers.end()) {
        throw error_t(error::unknown_trigger, "unknown hook trigger '{}'", name);
    }

    return it->second;
}

auto
ourd::hook::to_string(trigger_t trigger) -> std::string {
    for(auto it = triggers.begin(); it != triggers.end(); ++it) {
        if(it->second == trigger) {
            return it->first;
        }
    }

    return "unknown";
}

auto
ourd::hook::is_before(trigger_t trigger) -> bool {
    return trigger == trigger_t::before_save || trigger == trigger_t::before_delete;
}

// Hooks

registry_t::registry_t(std::unique_ptr<logging::logger_t> log):
    m_log(std::move(log)),
    m_sealed(false)
{ }

registry_t::~registry_t() = default;

void
registry_t::insert(const std::string& type, trigger_t trigger, const std::string& name, invocable_t invocable) {
    check_sealed(m_sealed);

    OURD_LOG_DEBUG(m_log, "registering hook '{}' for '{}' on '{}'", name, type, to_string(trigger));

    m_hooks[std::make_pair(type, trigger)].push_back(binding_t{name, std::move(invocable)});
}

void
registry_t::seal() {
    m_sealed = true;
}

auto
registry_t::size(const std::string& type, trigger_t trigger) const -> size_t {
    auto it = m_hooks.find(std::make_pair(type, trigger));
    return it == m_hooks.end() ? 0 : it->second.size();
}

auto
registry_t::invoke(const std::string& type, trigger_t trigger, request_t& request, dynamic_t& record) const -> bool {
    auto it = m_hooks.find(std::make_pair(type, trigger));

    if(it == m_hooks.end()) {
        return true;
    }

    const bool before = is_before(trigger);

    boost::optional<failure_t> first;

    for(auto binding = it->second.begin(); binding != it->second.end(); ++binding) {
        request_t scratch;

        // Every hook reports into its own scratch request, so that an after-* failure does not
        // leak into the subsequent hooks.
        scratch.method     = request.method;
        scratch.path       = request.path;
        scratch.headers    = request.headers;
        scratch.action     = request.action;
        scratch.payload    = request.payload;
        scratch.principal  = request.principal;
        scratch.connection = request.connection;
        scratch.hooks      = request.hooks;

        try {
            binding->invocable(scratch, record);
        } catch(const std::system_error& e) {
            scratch.fail(e);
        } catch(const std::exception& e) {
            scratch.fail(error::uncaught_error, e.what());
        }

        if(!scratch.failed()) {
            continue;
        }

        OURD_LOG_WARNING(m_log, "hook '{}' for '{}' on '{}' has failed: {}", binding->name, type,
            to_string(trigger), scratch.failure().message);

        if(!first) {
            first = scratch.failure();
        }

        if(before) {
            break;
        }
    }

    if(first) {
        request.fail(first->code, first->message, first->info);
        return false;
    }

    return true;
}

auto
registry_t::info() const -> dynamic_t {
    dynamic_t::array_t result;

    for(auto it = m_hooks.begin(); it != m_hooks.end(); ++it) {
        for(auto binding = it->second.begin(); binding != it->second.end(); ++binding) {
            result.push_back(dynamic_t::object_t{
                {"type",    it->first.first},
                {"trigger", to_string(it->first.second)},
                {"name",    binding->name}
            });
        }
    }

    return result;
}

// Lambdas

lambdas_t::lambdas_t():
    m_sealed(false)
{ }

void
lambdas_t::insert(const std::string& name, std::shared_ptr<api::handler_t> lambda) {
    check_sealed(m_sealed);

    if(m_lambdas.count(name)) {
        throw error_t(error::duplicate_lambda, "lambda '{}' is already registered", name);
    }

    m_lambdas[name] = std::move(lambda);
}

void
lambdas_t::seal() {
    m_sealed = true;
}

auto
lambdas_t::get(const std::string& name) const -> std::shared_ptr<api::handler_t> {
    auto it = m_lambdas.find(name);
    return it == m_lambdas.end() ? nullptr : it->second;
}

auto
lambdas_t::names() const -> std::vector<std::string> {
    std::vector<std::string> result;

    for(auto it = m_lambdas.begin(); it != m_lambdas.end(); ++it) {
        result.push_back(it->first);
    }

    return result;
}

// Timers

timers_t::timers_t():
    m_sealed(false)
{ }

void
timers_t::insert(const std::string& spec, const std::string& name, std::function<void()> invocable) {
    check_sealed(m_sealed);

    for(auto it = m_timers.begin(); it != m_timers.end(); ++it) {
        if(it->name == name) {
            throw error_t(error::duplicate_timer, "timer '{}' is already registered", name);
        }
    }

    const auto schedule = schedule_t::parse(spec);

    m_timers.push_back(timer_t{name, spec, schedule, std::move(invocable)});
}

void
timers_t::seal() {
    m_sealed = true;
}
