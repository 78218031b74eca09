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
#include "ourd/detail/token_store/void.hpp"
#include "ourd/errors.hpp"
#include "ourd/logging.hpp"
#include "ourd/repository.hpp"

#include "support.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

namespace ourd {
namespace {

namespace bpt = boost::posix_time;
namespace fs = boost::filesystem;

class files_store: public ::testing::Test {
protected:
    std::unique_ptr<context_t> context;
    testing::temp_directory_t directory;

    void
    SetUp() {
        context = testing::make_context(testing::config());
    }

    auto
    open() -> api::token_store_ptr {
        return context->repository().get<api::token_store_t>("fs", *context, "core",
            dynamic_t(dynamic_t::object_t{{"path", directory.path().string()}}));
    }
};

TEST_F(files_store, put_and_get) {
    auto store = open();

    api::token_t token;
    token.access_token = "d1c9-42ab";
    token.user_id = "alice";
    token.expired_at = bpt::ptime(boost::gregorian::date(2030, 1, 1), bpt::hours(12));

    store->put(token);

    EXPECT_TRUE(fs::is_regular_file(directory.path() / "d1c9-42ab"));

    const auto stored = store->get("d1c9-42ab");

    ASSERT_TRUE(static_cast<bool>(stored));
    EXPECT_EQ("d1c9-42ab", stored->access_token);
    EXPECT_EQ("alice", stored->user_id);
    EXPECT_EQ(token.expired_at, stored->expired_at);
}

TEST_F(files_store, tokens_survive_reopening) {
    api::token_t token;
    token.access_token = "persistent";
    token.user_id = "bob";

    open()->put(token);

    const auto stored = open()->get("persistent");

    ASSERT_TRUE(static_cast<bool>(stored));
    EXPECT_EQ("bob", stored->user_id);
    EXPECT_TRUE(stored->expired_at.is_not_a_date_time());
    EXPECT_FALSE(stored->expired(bpt::second_clock::universal_time()));
}

TEST_F(files_store, remove) {
    auto store = open();

    api::token_t token;
    token.access_token = "gone";
    token.user_id = "carol";

    store->put(token);
    store->remove("gone");

    EXPECT_FALSE(static_cast<bool>(store->get("gone")));
    EXPECT_NO_THROW(store->remove("gone"));
}

TEST_F(files_store, unknown_token) {
    EXPECT_FALSE(static_cast<bool>(open()->get("nobody")));
}

TEST_F(files_store, malformed_tokens) {
    auto store = open();

    EXPECT_FALSE(static_cast<bool>(store->get("")));
    EXPECT_FALSE(static_cast<bool>(store->get("../secret")));
    EXPECT_FALSE(static_cast<bool>(store->get("a/b")));

    api::token_t token;
    token.access_token = "../escape";
    token.user_id = "mallory";

    EXPECT_THROW(store->put(token), std::system_error);
    EXPECT_FALSE(fs::exists(directory.path().parent_path() / "escape"));
}

TEST_F(files_store, corrupted_file_is_ignored) {
    auto store = open();

    {
        fs::ofstream stream(directory.path() / "broken");
        stream << "{\"access_token\": \"broken\"";
    }

    {
        fs::ofstream stream(directory.path() / "swapped");
        stream << R"({"access_token": "other", "user_id": "eve", "expired_at": null})";
    }

    {
        fs::ofstream stream(directory.path() / "badtime");
        stream << R"({"access_token": "badtime", "user_id": "eve", "expired_at": "2026-13-45T00:00:00"})";
    }

    EXPECT_FALSE(static_cast<bool>(store->get("broken")));
    EXPECT_FALSE(static_cast<bool>(store->get("swapped")));
    EXPECT_FALSE(static_cast<bool>(store->get("badtime")));
}

TEST_F(files_store, requires_path) {
    EXPECT_THROW(
        context->repository().get<api::token_store_t>("fs", *context, "core", dynamic_t::empty_object),
        std::system_error
    );
}

TEST(token, expiry) {
    const bpt::ptime now(boost::gregorian::date(2026, 10, 19), bpt::hours(9));

    api::token_t token;

    EXPECT_FALSE(token.expired(now));

    token.expired_at = now + bpt::seconds(1);
    EXPECT_FALSE(token.expired(now));

    token.expired_at = now;
    EXPECT_TRUE(token.expired(now));
}

TEST(void_store, knows_no_tokens) {
    auto context = testing::make_context(testing::config());
    auto store = context->repository().get<api::token_store_t>("void", *context, "core", dynamic_t::empty_object);

    api::token_t token;
    token.access_token = "dropped";
    token.user_id = "alice";

    store->put(token);

    EXPECT_FALSE(static_cast<bool>(store->get("dropped")));
}

TEST(repository, lists_components) {
    auto context = testing::make_context(testing::config());

    EXPECT_THAT(context->repository().types<api::token_store_t>(), ::testing::ElementsAre("fs", "void"));
    EXPECT_TRUE(context->repository().contains<api::token_store_t>("fs"));
    EXPECT_FALSE(context->repository().contains<api::token_store_t>("redis"));
}

TEST(repository, unknown_component) {
    auto context = testing::make_context(testing::config());

    try {
        context->repository().get<api::token_store_t>("redis", *context, "core", dynamic_t::empty_object);
        FAIL() << "an unknown component must not be created";
    } catch(const std::system_error& e) {
        EXPECT_EQ(error::component_not_found, e.code());
    }
}

TEST(repository, duplicate_component) {
    api::repository_t repository(logging::make_null_logger());

    repository.insert<token_store::void_t>("void");

    try {
        repository.insert<token_store::void_t>("void");
        FAIL() << "a component name must be registered only once";
    } catch(const std::system_error& e) {
        EXPECT_EQ(error::duplicate_component, e.code());
    }
}

} // namespace
} // namespace ourd
