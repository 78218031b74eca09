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

#include "ourd/plugin/protocol.hpp"

#include "ourd/errors.hpp"
#include "ourd/hooks.hpp"
#include "ourd/json.hpp"

using namespace ourd;
using namespace ourd::plugin;

namespace ourd { namespace plugin { namespace protocol { namespace kind {

const char init[]   = "init";
const char op[]     = "op";
const char result[] = "result";
const char error[]  = "error";

}}}} // namespace ourd::plugin::protocol::kind

auto
ourd::plugin::protocol::reply_t::is_error() const -> bool {
    return kind == kind::error;
}

auto
ourd::plugin::protocol::encode(uint64_t id, const std::string& kind, const std::string& name, const dynamic_t& context) -> std::string {
    std::string line = format("{{\"id\":{},\"kind\":{},\"name\":{}", id, json::serialize(kind),
        json::serialize(name));

    if(kind != kind::init) {
        line += format(",\"context\":{}", json::serialize(context.is_null() ? dynamic_t::empty_object : context));
    }

    return line + "}\n";
}

auto
ourd::plugin::protocol::decode(const std::string& line) -> reply_t {
    dynamic_t message;

    try {
        message = json::parse(line);
    } catch(const std::system_error& e) {
        throw error_t(error::protocol_violation, "unable to parse plugin reply - {}", e.what());
    }

    if(!message.is_object()) {
        throw error_t(error::protocol_violation, "plugin reply must be an object");
    }

    const auto& object = message.as_object();

    const auto& id = object.at("id", dynamic_t::null);

    if(!id.is_uint()) {
        throw error_t(error::protocol_violation, "plugin reply has no valid \"id\"");
    }

    const auto& kind = object.at("kind", dynamic_t::null);

    if(!kind.is_string() || (kind.as_string() != kind::result && kind.as_string() != kind::error)) {
        throw error_t(error::protocol_violation, "plugin reply has no valid \"kind\"");
    }

    reply_t reply;

    reply.id   = id.as_uint();
    reply.kind = kind.as_string();
    reply.data = object.at("data", dynamic_t::null);

    return reply;
}

namespace {

auto
string_field(const dynamic_t& entry, const std::string& key, const char* section) -> std::string {
    const auto& value = entry.as_object().at(key, dynamic_t::null);

    if(!value.is_string() || value.as_string().empty()) {
        throw error_t(error::handshake_failed, "handshake \"{}\" entry has no valid \"{}\"", section, key);
    }

    return value.as_string();
}

auto
section(const dynamic_t::object_t& data, const char* name) -> const dynamic_t::array_t& {
    const auto& value = data.at(name, dynamic_t::empty_array);

    if(value.is_null()) {
        return dynamic_t::empty_array.as_array();
    }

    if(!value.is_array()) {
        throw error_t(error::handshake_failed, "handshake \"{}\" must be an array", name);
    }

    return value.as_array();
}

} // namespace

auto
manifest_t::from(const dynamic_t& data) -> manifest_t {
    if(!data.is_object()) {
        throw error_t(error::handshake_failed, "handshake reply must be an object");
    }

    manifest_t manifest;

    for(const auto& entry: section(data.as_object(), "handlers")) {
        if(entry.is_string()) {
            manifest.handlers.push_back(handler_t{entry.as_string(), true, false});
        } else if(entry.is_object()) {
            const dynamic_t key_required = entry.as_object().at("key_required", true);
            const dynamic_t user_required = entry.as_object().at("user_required", false);

            if(!key_required.is_bool()) {
                throw error_t(error::handshake_failed, "handshake handler \"key_required\" must be a boolean");
            }

            if(!user_required.is_bool()) {
                throw error_t(error::handshake_failed, "handshake handler \"user_required\" must be a boolean");
            }

            manifest.handlers.push_back(handler_t{
                string_field(entry, "name", "handlers"),
                key_required.as_bool() || user_required.as_bool(),
                user_required.as_bool()
            });
        } else {
            throw error_t(error::handshake_failed, "handshake handler must be a name or an object");
        }
    }

    for(const auto& entry: section(data.as_object(), "hooks")) {
        if(!entry.is_object()) {
            throw error_t(error::handshake_failed, "handshake hook must be an object");
        }

        hook_t hook{
            string_field(entry, "type", "hooks"),
            string_field(entry, "trigger", "hooks"),
            string_field(entry, "name", "hooks")
        };

        try {
            hook::trigger_from_string(hook.trigger);
        } catch(const std::system_error& e) {
            throw error_t(error::handshake_failed, "handshake hook '{}' - {}", hook.name, e.what());
        }

        manifest.hooks.push_back(hook);
    }

    for(const auto& entry: section(data.as_object(), "lambdas")) {
        if(!entry.is_string() || entry.as_string().empty()) {
            throw error_t(error::handshake_failed, "handshake lambda must be a name");
        }

        manifest.lambdas.push_back(entry.as_string());
    }

    for(const auto& entry: section(data.as_object(), "timers")) {
        if(!entry.is_object()) {
            throw error_t(error::handshake_failed, "handshake timer must be an object");
        }

        timer_t timer{string_field(entry, "spec", "timers"), string_field(entry, "name", "timers")};

        try {
            schedule_t::parse(timer.spec);
        } catch(const std::system_error& e) {
            throw error_t(error::handshake_failed, "handshake timer '{}' - {}", timer.name, e.what());
        }

        manifest.timers.push_back(timer);
    }

    return manifest;
}
