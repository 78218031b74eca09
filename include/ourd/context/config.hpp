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


#ifndef OURD_CONTEXT_CONFIG_HPP
#define OURD_CONTEXT_CONFIG_HPP

#include "ourd/common.hpp"
#include "ourd/dynamic.hpp"

#include <chrono>
#include <map>
#include <string>

namespace ourd {

/// Validated daemon configuration. Every section but "app" may be omitted.
struct config_t {
    struct app_t {
        std::string name;

        // Key which every client has to provide to reach key-protected actions.
        std::string api_key;

        // Key granting administrative access, also accepted wherever the api key is. May be empty.
        std::string master_key;
    };

    struct http_t {
        std::string endpoint;

        // Zero binds to any free port.
        port_t port;

        // Number of I/O threads serving the sockets.
        size_t pool;

        // How long in-flight requests are waited for on shutdown.
        std::chrono::milliseconds drain_timeout;
    };

    struct logging_t {
        // Logger name to its list of sinks, handed to the logging registry as is.
        dynamic_t loggers;

        logging::priorities severity;
    };

    // Backend selected by its registered type name, with backend-specific arguments.
    struct component_t {
        std::string type;
        dynamic_t args;
    };

    typedef std::map<std::string, component_t> component_map_t;

    app_t app;
    http_t http;
    logging_t logging;

    component_t storage;
    component_t token_store;

    // Plugin name to its transport and arguments, ordered by name.
    component_map_t plugins;

    /// Supported configuration file version.
    static
    auto
    version() -> unsigned;
};

/// Reads and validates the configuration file.
///
/// \throws std::system_error if the file is unreadable or malformed.
std::unique_ptr<config_t>
make_config(const std::string& source);

} // namespace ourd

#endif
