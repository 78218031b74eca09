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

#include "ourd/plugin/descriptor.hpp"

#include "ourd/defaults.hpp"
#include "ourd/errors.hpp"

using namespace ourd;
using namespace ourd::plugin;

namespace {

auto
milliseconds(const dynamic_t::object_t& args, const std::string& key, unsigned long default_) -> std::chrono::milliseconds {
    const dynamic_t value = args.at(key, default_);

    if(!value.is_uint() && !value.is_int()) {
        throw error_t("plugin argument \"{}\" must be a number of milliseconds", key);
    }

    return std::chrono::milliseconds(value.as_uint());
}

} // namespace

descriptor_t::descriptor_t():
    pool(defaults::pool_width)
{
    timeout.call      = std::chrono::milliseconds(defaults::call_timeout);
    timeout.handshake = std::chrono::milliseconds(defaults::handshake_timeout);
    timeout.acquire   = std::chrono::milliseconds(defaults::acquire_timeout);
    timeout.kill      = defaults::kill_timeout;

    respawn.limit  = defaults::respawn_limit;
    respawn.window = std::chrono::milliseconds(defaults::respawn_window);
}

auto
descriptor_t::from(const std::string& name, const config_t::component_t& component) -> descriptor_t {
    descriptor_t result;

    result.name = name;
    result.type = component.type;

    const auto& args = component.args.as_object();

    const auto& path = args.at("path", dynamic_t::null);

    if(!path.is_string() || path.as_string().empty()) {
        throw error_t("plugin '{}' has no executable \"path\"", name);
    }

    result.path = path.as_string();

    const auto& argv = args.at("argv", dynamic_t::empty_array);

    if(!argv.is_array()) {
        throw error_t("plugin '{}' \"argv\" must be an array of strings", name);
    }

    for(auto it = argv.as_array().begin(); it != argv.as_array().end(); ++it) {
        if(!it->is_string()) {
            throw error_t("plugin '{}' \"argv\" must be an array of strings", name);
        }

        result.argv.push_back(it->as_string());
    }

    result.pool = args.at("pool", defaults::pool_width).as_uint();

    if(result.pool == 0) {
        throw error_t("plugin '{}' pool width must be positive", name);
    }

    result.timeout.call      = milliseconds(args, "timeout", defaults::call_timeout);
    result.timeout.handshake = milliseconds(args, "handshake", defaults::handshake_timeout);
    result.timeout.acquire   = milliseconds(args, "acquire", defaults::acquire_timeout);
    result.timeout.kill      = args.at("kill", defaults::kill_timeout).as_uint();

    const auto& respawn = args.at("respawn", dynamic_t::empty_object);

    if(!respawn.is_object()) {
        throw error_t("plugin '{}' \"respawn\" must be an object", name);
    }

    result.respawn.limit  = respawn.as_object().at("limit", defaults::respawn_limit).as_uint();
    result.respawn.window = milliseconds(respawn.as_object(), "window", defaults::respawn_window);

    if(result.respawn.limit == 0) {
        throw error_t("plugin '{}' respawn limit must be positive", name);
    }

    return result;
}
