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

#ifndef OURD_PLUGIN_PROTOCOL_HPP
#define OURD_PLUGIN_PROTOCOL_HPP

#include "ourd/common.hpp"
#include "ourd/dynamic.hpp"

namespace ourd { namespace plugin { namespace protocol {

// Newline-delimited JSON messages, exchanged over the plugin process standard streams.
//
//   -> {"id": <uint>, "kind": "init" | "op", "name": <string>, "context": <object>}
//   <- {"id": <uint>, "kind": "result" | "error", "data": <any>}

namespace kind {

extern const char init[];
extern const char op[];
extern const char result[];
extern const char error[];

} // namespace kind

struct reply_t {
    uint64_t id;
    std::string kind;
    dynamic_t data;

    auto
    is_error() const -> bool;
};

/// Encodes a request as a single line, including the trailing newline. The context is omitted for
/// "init" requests.
auto
encode(uint64_t id, const std::string& kind, const std::string& name, const dynamic_t& context) -> std::string;

/// \throws std::system_error with error::protocol_violation if the line is not a valid reply.
auto
decode(const std::string& line) -> reply_t;

}}} // namespace ourd::plugin::protocol

namespace ourd { namespace plugin {

/// What a plugin contributes, as declared in its handshake reply.
struct manifest_t {
    struct handler_t {
        std::string name;
        bool key_required;
        // Only an authenticated user or the master key may call the handler. Implies the key check.
        bool user_required;
    };

    struct hook_t {
        std::string type;
        std::string trigger;
        std::string name;
    };

    struct timer_t {
        std::string spec;
        std::string name;
    };

    std::vector<handler_t> handlers;
    std::vector<hook_t> hooks;
    std::vector<std::string> lambdas;
    std::vector<timer_t> timers;

    /// \throws std::system_error with error::handshake_failed if the reply is malformed.
    static
    auto
    from(const dynamic_t& data) -> manifest_t;
};

}} // namespace ourd::plugin

#endif
