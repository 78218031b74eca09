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

#include "ourd/router.hpp"

#include "ourd/errors.hpp"
#include "ourd/logging.hpp"
#include "ourd/request.hpp"

#include <blackhole/logger.hpp>

using namespace ourd;

router_t::router_t(std::unique_ptr<logging::logger_t> log):
    m_log(std::move(log)),
    m_sealed(false)
{ }

router_t::~router_t() = default;

void
router_t::insert(const std::string& action, std::shared_ptr<api::handler_t> handler, api::chain_t chain) {
    check_sealed();

    if(m_actions.count(action)) {
        throw error_t(error::duplicate_action, "action '{}' is already registered", action);
    }

    OURD_LOG_DEBUG(m_log, "registering action '{}' with {} preprocessor(s)", action, chain.size());

    m_actions[action] = route_t{std::move(handler), std::move(chain)};
}

void
router_t::insert(const std::string& method,
                 const std::string& pattern,
                 std::shared_ptr<api::handler_t> handler,
                 api::chain_t chain)
{
    check_sealed();

    for(auto it = m_patterns.begin(); it != m_patterns.end(); ++it) {
        if(it->method == method && it->source == pattern) {
            throw error_t(error::duplicate_action, "route '{} {}' is already registered", method, pattern);
        }
    }

    std::regex regex;

    try {
        regex = std::regex(pattern, std::regex::ECMAScript);
    } catch(const std::regex_error& e) {
        throw error_t(error::malformed_request, "invalid route pattern '{}' - {}", pattern, e.what());
    }

    OURD_LOG_DEBUG(m_log, "registering route '{} {}'", method, pattern);

    m_patterns.push_back(pattern_t{method, pattern, std::move(regex), route_t{std::move(handler), std::move(chain)}});
}

void
router_t::seal() {
    m_sealed = true;

    OURD_LOG_INFO(m_log, "router has been sealed with {} action(s) and {} route(s)",
        m_actions.size(), m_patterns.size());
}

auto
router_t::contains(const std::string& action) const -> bool {
    return m_actions.count(action) != 0;
}

auto
router_t::actions() const -> std::vector<std::string> {
    std::vector<std::string> result;

    for(auto it = m_actions.begin(); it != m_actions.end(); ++it) {
        result.push_back(it->first);
    }

    return result;
}

void
router_t::dispatch(request_t& request) const {
    auto it = m_actions.find(request.action);

    if(it == m_actions.end()) {
        OURD_LOG_DEBUG(m_log, "unable to dispatch unknown action '{}'", request.action);

        request.fail(error::unknown_action, format("action '{}' is not registered", request.action));
        return;
    }

    invoke(it->second, request);
}

auto
router_t::dispatch(const std::string& method, const std::string& path, request_t& request) const -> bool {
    for(auto it = m_patterns.begin(); it != m_patterns.end(); ++it) {
        std::smatch match;

        if(it->method != method || !std::regex_match(path, match, it->regex)) {
            continue;
        }

        request.params.clear();

        for(size_t i = 1; i < match.size(); ++i) {
            request.params.push_back(match[i].str());
        }

        invoke(it->route, request);

        return true;
    }

    return false;
}

void
router_t::invoke(const route_t& route, request_t& request) const {
    try {
        for(auto it = route.chain.begin(); it != route.chain.end(); ++it) {
            (*it)->process(request);

            if(request.failed()) {
                OURD_LOG_DEBUG(m_log, "preprocessor has aborted the request: {}", request.failure().message);
                return;
            }
        }

        auto result = route.handler->handle(request);

        if(!request.failed()) {
            request.respond(std::move(result));
        }
    } catch(const std::system_error& e) {
        OURD_LOG_WARNING(m_log, "unable to process the request: {}", error::to_string(e));
        request.fail(e);
    } catch(const std::exception& e) {
        OURD_LOG_ERROR(m_log, "uncaught exception while processing the request: {}", e.what());
        request.fail(error::uncaught_error, e.what());
    }
}

void
router_t::check_sealed() const {
    if(m_sealed) {
        throw error_t(error::registry_sealed, "unable to register routes after startup");
    }
}
