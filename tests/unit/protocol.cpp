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

#include <gmock/gmock.h>

#include "ourd/errors.hpp"
#include "ourd/json.hpp"
#include "ourd/plugin/protocol.hpp"

namespace ourd {
namespace {

namespace protocol = plugin::protocol;

TEST(protocol, encode_init) {
    const auto line = protocol::encode(0, protocol::kind::init, protocol::kind::init, dynamic_t::null);

    ASSERT_EQ('\n', line.back());

    const auto message = json::parse(line);
    const auto& object = message.as_object();

    EXPECT_EQ(0u, object.at("id").as_uint());
    EXPECT_EQ("init", object.at("kind").as_string());
    EXPECT_EQ("init", object.at("name").as_string());
    EXPECT_EQ(0u, object.count("context"));
}

TEST(protocol, encode_op) {
    const dynamic_t context = dynamic_t::object_t{
        {"action",  "note:create"},
        {"payload", dynamic_t::object_t{{"text", "line\nbreak \"quoted\""}}}
    };

    const auto line = protocol::encode(7, protocol::kind::op, "note:create", context);

    // A single line, embedded newlines are escaped.
    EXPECT_EQ(line.size() - 1, line.find('\n'));

    const auto message = json::parse(line);
    const auto& object = message.as_object();

    EXPECT_EQ(7u, object.at("id").as_uint());
    EXPECT_EQ("op", object.at("kind").as_string());
    EXPECT_EQ(context, object.at("context"));
}

TEST(protocol, encode_op_without_context) {
    const auto message = json::parse(protocol::encode(1, protocol::kind::op, "tick", dynamic_t::null));

    EXPECT_TRUE(message.as_object().at("context").is_object());
}

TEST(protocol, decode) {
    auto reply = protocol::decode(R"({"id": 3, "kind": "result", "data": {"ok": true}})");

    EXPECT_EQ(3u, reply.id);
    EXPECT_FALSE(reply.is_error());
    EXPECT_TRUE(reply.data.as_object().at("ok").as_bool());

    reply = protocol::decode(R"({"id": 4, "kind": "error", "data": "nope"})");

    EXPECT_TRUE(reply.is_error());
    EXPECT_EQ("nope", reply.data.as_string());

    reply = protocol::decode(R"({"id": 5, "kind": "result"})");

    EXPECT_TRUE(reply.data.is_null());
}

TEST(protocol, decode_violations) {
    const std::vector<std::string> samples = {
        "not json",
        "[1, 2, 3]",
        R"({"kind": "result"})",
        R"({"id": -1, "kind": "result"})",
        R"({"id": "1", "kind": "result"})",
        R"({"id": 1, "kind": "op"})",
        R"({"id": 1})"
    };

    for(auto it = samples.begin(); it != samples.end(); ++it) {
        try {
            protocol::decode(*it);
            ADD_FAILURE() << "'" << *it << "' has been decoded";
        } catch(const std::system_error& e) {
            EXPECT_EQ(error::protocol_violation, e.code()) << *it;
        }
    }
}

TEST(manifest, full) {
    const auto manifest = plugin::manifest_t::from(json::parse(R"({
        "handlers": [
            "note:create",
            {"name": "note:list", "key_required": false},
            {"name": "note:drop"},
            {"name": "note:save", "key_required": false, "user_required": true}
        ],
        "hooks": [{"type": "note", "trigger": "before-save", "name": "validate"}],
        "lambdas": ["summarize"],
        "timers": [{"spec": "@every 5m", "name": "cleanup"}, {"spec": "@yearly", "name": "archive"}]
    })"));

    ASSERT_EQ(4u, manifest.handlers.size());
    EXPECT_EQ("note:create", manifest.handlers[0].name);
    EXPECT_TRUE(manifest.handlers[0].key_required);
    EXPECT_FALSE(manifest.handlers[0].user_required);
    EXPECT_EQ("note:list", manifest.handlers[1].name);
    EXPECT_FALSE(manifest.handlers[1].key_required);
    EXPECT_TRUE(manifest.handlers[2].key_required);
    EXPECT_FALSE(manifest.handlers[2].user_required);

    // A user is authenticated, so the key check can't be turned off.
    EXPECT_TRUE(manifest.handlers[3].key_required);
    EXPECT_TRUE(manifest.handlers[3].user_required);

    ASSERT_EQ(1u, manifest.hooks.size());
    EXPECT_EQ("note", manifest.hooks[0].type);
    EXPECT_EQ("before-save", manifest.hooks[0].trigger);
    EXPECT_EQ("validate", manifest.hooks[0].name);

    EXPECT_THAT(manifest.lambdas, ::testing::ElementsAre("summarize"));

    ASSERT_EQ(2u, manifest.timers.size());
    EXPECT_EQ("@every 5m", manifest.timers[0].spec);
    EXPECT_EQ("cleanup", manifest.timers[0].name);
    EXPECT_EQ("@yearly", manifest.timers[1].spec);
}

TEST(manifest, empty) {
    const auto manifest = plugin::manifest_t::from(dynamic_t::empty_object);

    EXPECT_TRUE(manifest.handlers.empty());
    EXPECT_TRUE(manifest.hooks.empty());
    EXPECT_TRUE(manifest.lambdas.empty());
    EXPECT_TRUE(manifest.timers.empty());
}

TEST(manifest, malformed) {
    const std::vector<std::string> samples = {
        "null",
        R"(["note:create"])",
        R"({"handlers": "note:create"})",
        R"({"handlers": [42]})",
        R"({"handlers": [{"name": "note:create", "key_required": "yes"}]})",
        R"({"handlers": [{"name": "note:create", "user_required": 1}]})",
        R"({"hooks": [{"type": "note", "trigger": "before-save"}]})",
        R"({"lambdas": [""]})",
        R"({"timers": [{"name": "cleanup"}]})",
        R"({"timers": [{"spec": "@fortnightly", "name": "cleanup"}]})",
        R"({"timers": [{"spec": "0 0 25 * * *", "name": "cleanup"}]})"
    };

    for(auto it = samples.begin(); it != samples.end(); ++it) {
        try {
            plugin::manifest_t::from(json::parse(*it));
            ADD_FAILURE() << "'" << *it << "' has been accepted";
        } catch(const std::system_error& e) {
            EXPECT_EQ(error::handshake_failed, e.code()) << *it;
        }
    }
}

} // namespace
} // namespace ourd
