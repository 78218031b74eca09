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

#include "ourd/dynamic.hpp"
#include "ourd/errors.hpp"
#include "ourd/json.hpp"

#include <boost/lexical_cast.hpp>

namespace ourd {
namespace {

TEST(dynamic, integers) {
    const auto value = json::parse(R"({"positive": 42, "negative": -7, "real": 1.5})");
    const auto& object = value.as_object();

    EXPECT_TRUE(object.at("positive").is_uint());
    EXPECT_EQ(42, object.at("positive").as_int());
    EXPECT_EQ(42u, object.at("positive").as_uint());

    EXPECT_TRUE(object.at("negative").is_int());
    EXPECT_EQ(-7, object.at("negative").as_int());
    EXPECT_THROW(object.at("negative").as_uint(), std::exception);

    EXPECT_DOUBLE_EQ(1.5, object.at("real").as_double());
}

TEST(dynamic, object_defaults) {
    const dynamic_t value = dynamic_t::object_t{{"name", "notes"}};
    const auto& object = value.as_object();

    EXPECT_EQ("notes", object.at("name", "fallback").as_string());
    EXPECT_TRUE(object.at("missing", dynamic_t::null).is_null());
}

TEST(dynamic, equality) {
    EXPECT_EQ(json::parse(R"({"a": [1, "two", null, true]})"),
              dynamic_t(dynamic_t::object_t{{"a", dynamic_t::array_t{1u, "two", dynamic_t::null, true}}}));
    EXPECT_NE(dynamic_t("1"), dynamic_t(1));
}

TEST(json, serialize) {
    const dynamic_t value = dynamic_t::object_t{
        {"text", "line\nbreak"},
        {"list", dynamic_t::array_t{1, 2}},
        {"none", dynamic_t::null}
    };

    const auto text = json::serialize(value);

    EXPECT_EQ(std::string::npos, text.find('\n'));
    EXPECT_EQ(value, json::parse(text));
    EXPECT_EQ(text, boost::lexical_cast<std::string>(value));
}

TEST(json, relaxed) {
    const auto source = "{\n  // comment\n  \"a\": 1,\n}";

    EXPECT_THROW(json::parse(source), std::system_error);
    EXPECT_EQ(1, json::parse(source, json::mode_t::relaxed).as_object().at("a").as_int());
}

TEST(json, malformed) {
    try {
        json::parse("{\"a\": ");
        FAIL() << "truncated document has been parsed";
    } catch(const std::system_error& e) {
        EXPECT_EQ(error::parse_error, e.code());
    }
}

TEST(json, nesting_limit) {
    const auto nested = [](size_t depth) -> std::string {
        return std::string(depth, '[') + std::string(depth, ']');
    };

    EXPECT_TRUE(json::parse(nested(128)).is_array());

    const std::vector<std::string> samples = {
        nested(129),
        nested(100000),
        std::string(100000, '[') + "]",
        "{\"a\": " + nested(200) + "}"
    };

    for(auto it = samples.begin(); it != samples.end(); ++it) {
        try {
            json::parse(*it);
            ADD_FAILURE() << "document of " << it->size() << " bytes has been parsed";
        } catch(const std::system_error& e) {
            EXPECT_EQ(error::parse_error, e.code());
        }
    }
}

} // namespace
} // namespace ourd
