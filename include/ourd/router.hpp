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

#ifndef OURD_ROUTER_HPP
#define OURD_ROUTER_HPP

#include "ourd/api/handler.hpp"
#include "ourd/common.hpp"

#include <regex>

namespace ourd {

/// Maps action names and path patterns to handlers with their preprocessor chains.
///
/// The router is populated during startup and sealed before the gateway starts accepting requests,
/// after which it is only read and may be used from multiple threads without synchronization.
class router_t {
    OURD_DECLARE_NONCOPYABLE(router_t)

    struct route_t {
        std::shared_ptr<api::handler_t> handler;
        api::chain_t chain;
    };

    struct pattern_t {
        std::string method;
        std::string source;
        std::regex  regex;
        route_t     route;
    };

    const std::unique_ptr<logging::logger_t> m_log;

    std::map<std::string, route_t> m_actions;
    std::vector<pattern_t> m_patterns;

    bool m_sealed;

public:
    explicit
    router_t(std::unique_ptr<logging::logger_t> log);

   ~router_t();

    /// Binds the action to the handler.
    ///
    /// \throws std::system_error with error::duplicate_action if the action is already bound.
    void
    insert(const std::string& action, std::shared_ptr<api::handler_t> handler, api::chain_t chain);

    /// Binds a regular expression on the request path, without its leading slash. Patterns are
    /// tried in the registration order and the first match wins.
    void
    insert(const std::string& method,
           const std::string& pattern,
           std::shared_ptr<api::handler_t> handler,
           api::chain_t chain);

    /// Forbids any further registration.
    void
    seal();

    auto
    contains(const std::string& action) const -> bool;

    auto
    actions() const -> std::vector<std::string>;

    /// Dispatches the request by its action name. Unknown actions fail the request.
    void
    dispatch(request_t& request) const;

    /// Dispatches the request by its method and path.
    ///
    /// \returns false if no pattern matches, leaving the request untouched.
    auto
    dispatch(const std::string& method, const std::string& path, request_t& request) const -> bool;

private:
    void
    invoke(const route_t& route, request_t& request) const;

    void
    check_sealed() const;
};

} // namespace ourd

#endif
