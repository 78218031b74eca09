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

#include "ourd/api/token_store.hpp"
#include "ourd/context.hpp"
#include "ourd/detail/preprocessors.hpp"
#include "ourd/errors.hpp"
#include "ourd/hooks.hpp"
#include "ourd/plugin/registrar.hpp"
#include "ourd/request.hpp"
#include "ourd/router.hpp"

#include "support.hpp"

namespace ourd {
namespace {

using hook::trigger_t;

namespace bpt = boost::posix_time;

class registrar: public ::testing::Test {
protected:
    std::unique_ptr<context_t> context;

    std::unique_ptr<router_t> router;
    std::unique_ptr<hook::registry_t> hooks;
    std::unique_ptr<hook::lambdas_t> lambdas;
    std::unique_ptr<hook::timers_t> timers;

    std::vector<std::shared_ptr<plugin::pool_t>> pools;

    testing::temp_directory_t directory;
    api::token_store_ptr tokens;

    void
    start(const std::string& plugins) {
        pools.clear();
        timers.reset();
        lambdas.reset();
        hooks.reset();
        router.reset();

        context = testing::make_context(testing::config(plugins));

        router.reset(new router_t(context->log("router")));
        hooks.reset(new hook::registry_t(context->log("hooks")));
        lambdas.reset(new hook::lambdas_t());
        timers.reset(new hook::timers_t());

        tokens = context->repository().get<api::token_store_t>("fs", *context, "core",
            dynamic_t(dynamic_t::object_t{{"path", directory.path().string()}}));

        const api::chain_t keyed = {
            std::make_shared<preprocessor::tokens_t>(tokens),
            std::make_shared<preprocessor::authenticator_t>("secret", "master")
        };

        api::chain_t users = keyed;
        users.push_back(std::make_shared<preprocessor::require_user_t>());

        plugin::registrar_t registrar(*context, *router, *hooks, *lambdas, *timers, keyed, api::chain_t(), users);

        pools = registrar.start(context->config().plugins);
    }

    void
    TearDown() {
        for(auto it = pools.begin(); it != pools.end(); ++it) {
            (*it)->terminate();
        }

        pools.clear();
    }

    auto
    dispatch(const std::string& action, dynamic_t payload = dynamic_t::empty_object) -> request_t {
        request_t request(action, std::move(payload));
        router->dispatch(request);
        return request;
    }
};

TEST_F(registrar, installs_manifest) {
    start("{\"demo\": " + testing::plugin("echo") + "}");

    ASSERT_EQ(1u, pools.size());
    EXPECT_FALSE(pools[0]->disabled());

    EXPECT_TRUE(router->contains("demo:echo"));
    EXPECT_TRUE(router->contains("demo:open"));
    EXPECT_TRUE(router->contains("demo:lambda"));

    EXPECT_EQ(1u, hooks->size("note", trigger_t::before_save));
    EXPECT_EQ(1u, hooks->size("note", trigger_t::after_save));

    EXPECT_THAT(lambdas->names(), ::testing::ElementsAre("demo:lambda"));

    ASSERT_EQ(2u, timers->all().size());
    EXPECT_EQ("tick", timers->all()[0].name);
    EXPECT_EQ("noon", timers->all()[1].name);
    EXPECT_EQ(bpt::hours(1), timers->all()[0].schedule.interval);
}

TEST_F(registrar, keyed_and_open_handlers) {
    start("{\"demo\": " + testing::plugin("echo") + "}");

    auto missing = dispatch("demo:echo");

    ASSERT_TRUE(missing.failed());
    EXPECT_EQ(error::missing_api_key, missing.failure().code);

    auto keyed = dispatch("demo:echo", dynamic_t::object_t{{"api_key", "secret"}, {"text", "hi"}});

    ASSERT_FALSE(keyed.failed()) << keyed.failure().message;

    const auto& result = keyed.result().as_object();

    EXPECT_EQ("demo:echo", result.at("action").as_string());
    EXPECT_EQ("hi", result.at("payload").as_object().at("text").as_string());
    EXPECT_EQ("api-key", result.at("principal").as_object().at("kind").as_string());

    auto open = dispatch("demo:open");

    ASSERT_FALSE(open.failed()) << open.failure().message;
    EXPECT_EQ("none", open.result().as_object().at("principal").as_object().at("kind").as_string());
}

TEST_F(registrar, user_required_handlers) {
    start("{\"demo\": " + testing::plugin("echo") + "}");

    api::token_t token;
    token.access_token = "c0ffee";
    token.user_id = "alice";

    tokens->put(token);

    auto keyed = dispatch("demo:mine", dynamic_t::object_t{{"api_key", "secret"}});

    ASSERT_TRUE(keyed.failed());
    EXPECT_EQ(error::user_required, keyed.failure().code);

    auto forged = dispatch("demo:mine", dynamic_t::object_t{{"access_token", "decaf"}});

    ASSERT_TRUE(forged.failed());
    EXPECT_EQ(error::invalid_access_token, forged.failure().code);

    auto user = dispatch("demo:mine", dynamic_t::object_t{{"access_token", "c0ffee"}});

    ASSERT_FALSE(user.failed()) << user.failure().message;

    const auto& principal = user.result().as_object().at("principal").as_object();

    EXPECT_EQ("user", principal.at("kind").as_string());
    EXPECT_EQ("alice", principal.at("user_id").as_string());

    // Users may call keyed handlers as well.
    auto echo = dispatch("demo:echo", dynamic_t::object_t{{"access_token", "c0ffee"}});

    ASSERT_FALSE(echo.failed()) << echo.failure().message;
}

TEST_F(registrar, remote_error) {
    start("{\"demo\": " + testing::plugin("echo") + "}");

    auto request = dispatch("demo:fail", dynamic_t::object_t{{"api_key", "master"}});

    ASSERT_TRUE(request.failed());
    EXPECT_EQ(error::remote_error, request.failure().code);
    EXPECT_EQ("refused by plugin", request.failure().message);

    const auto& info = request.failure().info.as_object();

    EXPECT_EQ("E_DEMO", info.at("code").as_string());
    EXPECT_EQ("title", info.at("info").as_object().at("field").as_string());
}

TEST_F(registrar, plugin_hooks) {
    start("{\"demo\": " + testing::plugin("echo") + "}");

    request_t request("note:save");
    dynamic_t record = dynamic_t::object_t{{"text", "hello"}};

    ASSERT_TRUE(hooks->invoke("note", trigger_t::before_save, request, record));

    EXPECT_TRUE(record.as_object().at("stamped").as_bool());
    EXPECT_EQ("hello", record.as_object().at("text").as_string());

    EXPECT_FALSE(hooks->invoke("note", trigger_t::after_save, request, record));
    ASSERT_TRUE(request.failed());
    EXPECT_EQ("vetoed", request.failure().message);
}

TEST_F(registrar, plugin_timer) {
    start("{\"demo\": " + testing::plugin("echo") + "}");

    ASSERT_EQ(2u, timers->all().size());

    timers->all()[0].invocable();
    timers->all()[1].invocable();

    EXPECT_EQ(2u, pools[0]->info().as_object().at("calls").as_uint());
}

TEST_F(registrar, crash_is_recovered) {
    start("{\"demo\": " + testing::plugin("echo") + "}");

    auto crash = dispatch("demo:exit", dynamic_t::object_t{{"api_key", "secret"}});

    ASSERT_TRUE(crash.failed());
    EXPECT_EQ(error::process_exited, crash.failure().code);

    auto next = dispatch("demo:echo", dynamic_t::object_t{{"api_key", "secret"}});

    EXPECT_FALSE(next.failed()) << next.failure().message;
}

TEST_F(registrar, timed_out_instance_is_replaced) {
    start("{\"demo\": " + testing::plugin("echo") + "}");

    auto first = dispatch("demo:pid", dynamic_t::object_t{{"api_key", "secret"}});

    ASSERT_FALSE(first.failed()) << first.failure().message;

    // Sleeps past the two second call timeout.
    auto slow = dispatch("demo:sleep", dynamic_t::object_t{{"api_key", "secret"}, {"ms", 3000}});

    ASSERT_TRUE(slow.failed());
    EXPECT_EQ(error::call_timeout, slow.failure().code);

    auto second = dispatch("demo:pid", dynamic_t::object_t{{"api_key", "secret"}});

    ASSERT_FALSE(second.failed()) << second.failure().message;
    EXPECT_FALSE(first.result() == second.result());

    EXPECT_EQ(1u, pools[0]->info().as_object().at("died").as_uint());
}

TEST_F(registrar, instance_crashing_on_call_is_replaced) {
    start("{\"demo\": " + testing::plugin("crash-on-op") + "}");

    ASSERT_FALSE(pools[0]->disabled());

    auto crash = dispatch("demo:echo", dynamic_t::object_t{{"api_key", "secret"}});

    ASSERT_TRUE(crash.failed());
    EXPECT_EQ(error::process_exited, crash.failure().code);

    // The replacement completes its handshake before the acquire timeout.
    auto next = dispatch("demo:echo", dynamic_t::object_t{{"api_key", "secret"}});

    ASSERT_TRUE(next.failed());
    EXPECT_EQ(error::process_exited, next.failure().code);

    EXPECT_EQ(2u, pools[0]->info().as_object().at("died").as_uint());
    EXPECT_FALSE(pools[0]->disabled());
}

class registrar_writes: public registrar {
protected:
    std::vector<dynamic_t> writes;
    std::vector<std::string> after;

    void
    SetUp() {
        start("{\"demo\": " + testing::plugin("echo") + "}");

        // Runs after the plugin's "stamp" hook.
        hooks->insert("note", trigger_t::before_save, "guard", [](request_t& request, dynamic_t& record) {
            if(record.as_object().at("text", "").as_string().empty()) {
                request.fail(error::remote_error, "text is required");
            }
        });

        hooks->insert("note", trigger_t::after_save, "audit", [this](request_t&, dynamic_t& record) {
            after.push_back(record.as_object().at("text").as_string());
        });

        const api::chain_t chain = {std::make_shared<preprocessor::hooks_t>(*hooks)};

        router->insert("note:save", api::make_handler([this](request_t& request) -> dynamic_t {
            dynamic_t record = request.payload.as_object().at("record");

            if(!request.hooks->invoke("note", trigger_t::before_save, request, record)) {
                return dynamic_t::null;
            }

            writes.push_back(record);

            request.hooks->invoke("note", trigger_t::after_save, request, record);

            return record;
        }), chain);
    }
};

TEST_F(registrar_writes, before_save_failure_prevents_write) {
    auto request = dispatch("note:save", dynamic_t::object_t{{"record", dynamic_t::object_t{{"text", ""}}}});

    ASSERT_TRUE(request.failed());
    EXPECT_EQ("text is required", request.failure().message);

    EXPECT_TRUE(writes.empty());
    EXPECT_TRUE(after.empty());

    // Only "stamp" has reached the plugin, "veto" is an after-save hook.
    EXPECT_EQ(1u, pools[0]->info().as_object().at("calls").as_uint());
}

TEST_F(registrar_writes, after_save_hooks_see_written_record) {
    auto request = dispatch("note:save", dynamic_t::object_t{{"record", dynamic_t::object_t{{"text", "hi"}}}});

    ASSERT_EQ(1u, writes.size());
    EXPECT_TRUE(writes[0].as_object().at("stamped").as_bool());

    EXPECT_THAT(after, ::testing::ElementsAre("hi"));

    // The plugin's after-save "veto" fails the request once the write has happened.
    ASSERT_TRUE(request.failed());
    EXPECT_EQ("vetoed", request.failure().message);
    EXPECT_EQ(2u, pools[0]->info().as_object().at("calls").as_uint());
}

TEST_F(registrar, failed_plugins_are_skipped) {
    start(
        "{"
        "  \"broken\": "  + testing::plugin("exit") + ","
        "  \"cron\": "    + testing::plugin("bad-timer") + ","
        "  \"demo\": "    + testing::plugin("echo") + ","
        "  \"garbage\": " + testing::plugin("garbage") + ","
        "  \"rejecting\": " + testing::plugin("reject") + ","
        "  \"silent\": "  + testing::plugin("silent") +
        "}"
    );

    ASSERT_EQ(6u, pools.size());

    for(auto it = pools.begin(); it != pools.end(); ++it) {
        EXPECT_EQ((*it)->descriptor().name != "demo", (*it)->disabled()) << (*it)->descriptor().name;
    }

    EXPECT_TRUE(router->contains("demo:echo"));

    auto request = dispatch("demo:echo", dynamic_t::object_t{{"api_key", "secret"}});

    EXPECT_FALSE(request.failed());
}

TEST_F(registrar, duplicates_are_fatal) {
    try {
        start("{\"first\": " + testing::plugin("echo") + ", \"second\": " + testing::plugin("echo") + "}");
        FAIL() << "duplicate registrations have been accepted";
    } catch(const std::system_error& e) {
        EXPECT_EQ(error::duplicate_action, e.code());
    }
}

TEST_F(registrar, unknown_transport) {
    try {
        start("{\"demo\": {\"type\": \"carrier-pigeon\", \"args\": {\"path\": \"/bin/true\"}}}");
        FAIL() << "unknown transport has been accepted";
    } catch(const std::system_error& e) {
        EXPECT_EQ(error::component_not_found, e.code());
    }

    EXPECT_TRUE(pools.empty());
}

TEST_F(registrar, malformed_descriptor) {
    EXPECT_THROW(start("{\"demo\": {\"type\": \"exec\", \"args\": {\"argv\": []}}}"), std::system_error);
    EXPECT_THROW(start("{\"demo\": {\"type\": \"exec\", \"args\": {\"path\": \"/bin/true\", \"pool\": 0}}}"),
        std::system_error);
}

} // namespace
} // namespace ourd
