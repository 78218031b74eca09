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

#ifndef OURD_PLUGIN_DESCRIPTOR_HPP
#define OURD_PLUGIN_DESCRIPTOR_HPP

#include "ourd/common.hpp"
#include "ourd/context/config.hpp"
#include "ourd/dynamic.hpp"

#include <chrono>

namespace ourd { namespace plugin {

/// Static configuration of one plugin, built from its "plugins" configuration entry.
struct descriptor_t {
    std::string name;

    // Transport kind, i.e. the repository component which spawns the plugin instances.
    std::string type;

    std::string path;
    std::vector<std::string> argv;

    // Number of plugin instances.
    size_t pool;

    struct {
        std::chrono::milliseconds call;
        std::chrono::milliseconds handshake;
        std::chrono::milliseconds acquire;

        // Grace period between SIGTERM and SIGKILL, in seconds.
        unsigned long kill;
    } timeout;

    // The plugin is disabled once its instances have died "limit" times within "window".
    struct {
        size_t limit;
        std::chrono::milliseconds window;
    } respawn;

    descriptor_t();

    /// \throws std::system_error if the configuration entry is malformed.
    static
    auto
    from(const std::string& name, const config_t::component_t& component) -> descriptor_t;
};

}} // namespace ourd::plugin

#endif
