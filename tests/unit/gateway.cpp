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

#include "ourd/context.hpp"
#include "ourd/detail/gateway/http.hpp"
#include "ourd/detail/preprocessors.hpp"
#include "ourd/errors.hpp"
#include "ourd/json.hpp"
#include "ourd/router.hpp"

#include "support.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <boost/algorithm/string/predicate.hpp>

#include <array>
#include <thread>

namespace ourd {
namespace {

class http_gateway: public ::testing::Test {
protected:
    std::unique_ptr<context_t> context;
    std::unique_ptr<router_t> router;
    std::unique_ptr<gateway::http_t> http;

    void
    SetUp() {
        context = testing::make_context(testing::config());
        router.reset(new router_t(context->log("router")));

        const api::chain_t keyed = {std::make_shared<preprocessor::api_key_t>("secret", "master")};

        router->insert("", api::make_handler([](request_t&) -> dynamic_t {
            return dynamic_t::object_t{{"status", "OK"}};
        }), api::chain_t());

        router->insert("note:echo", api::make_handler([](request_t& request) -> dynamic_t {
            return request.payload;
        }), keyed);

        router->insert("note:slow", api::make_handler([](request_t&) -> dynamic_t {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            return "done";
        }), api::chain_t());

        router->insert("record:save", api::make_handler([](request_t& request) -> dynamic_t {
            return request.action;
        }), api::chain_t());

        router->insert("note:nap", api::make_handler([](request_t&) -> dynamic_t {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
            return "rested";
        }), api::chain_t());

        router->insert("GET", "files/(.+)", api::make_handler([](request_t& request) -> dynamic_t {
            return request.params.at(0);
        }), api::chain_t());

        router->seal();

        http.reset(new gateway::http_t(*context, *router, context->config().http));
    }

    void
    TearDown() {
        http.reset();
        router.reset();
        context.reset();
    }

    auto
    post(const std::string& target, const std::string& body) const -> gateway::response_t {
        return http->process("POST", target, request_t::header_map_t(), body);
    }
};

auto
error_name(const gateway::response_t& response) -> std::string {
    return response.body.as_object().at("error").as_object().at("name").as_string();
}

TEST_F(http_gateway, home) {
    const auto response = post("/", "");

    EXPECT_EQ(200, response.status);
    EXPECT_EQ("OK", response.body.as_object().at("result").as_object().at("status").as_string());
}

TEST_F(http_gateway, action_from_body) {
    const auto response = post("/", R"({"action": "note:echo", "api_key": "secret", "text": "hi"})");

    ASSERT_EQ(200, response.status);
    EXPECT_EQ("hi", response.body.as_object().at("result").as_object().at("text").as_string());
}

TEST_F(http_gateway, action_from_path) {
    const auto response = post("/note/echo?verbose=1", R"({"api_key": "secret"})");

    EXPECT_EQ(200, response.status);
}

TEST_F(http_gateway, error_statuses) {
    auto response = post("/", R"({"action": "note:missing"})");

    EXPECT_EQ(404, response.status);
    EXPECT_EQ("unknown_action", error_name(response));

    response = post("/", R"({"action": "note:echo"})");

    EXPECT_EQ(401, response.status);
    EXPECT_EQ("missing_api_key", error_name(response));

    response = post("/", R"({"action": "note:echo", "api_key": "guess"})");

    EXPECT_EQ(401, response.status);

    response = post("/", "{not json");

    EXPECT_EQ(400, response.status);
    EXPECT_EQ("malformed_request", error_name(response));

    response = post("/", "[1, 2]");

    EXPECT_EQ(400, response.status);

    response = post("/", R"({"action": 42})");

    EXPECT_EQ(400, response.status);

    response = http->process("DELETE", "/note/echo", request_t::header_map_t(), "");

    EXPECT_EQ(405, response.status);
    EXPECT_EQ("method_not_allowed", error_name(response));
}

TEST_F(http_gateway, pattern_routes) {
    const auto response = http->process("GET", "/files/cat.png", request_t::header_map_t(), "");

    EXPECT_EQ(200, response.status);
    EXPECT_EQ("cat.png", response.body.as_object().at("result").as_string());
}

TEST_F(http_gateway, header_key) {
    request_t::header_map_t headers;
    headers["X-Ourd-Api-Key"] = "master";

    const auto response = http->process("POST", "/note/echo", headers, "{}");

    EXPECT_EQ(200, response.status);
}

TEST_F(http_gateway, status_mapping) {
    EXPECT_EQ(503, gateway::status_of(error::pool_exhausted));
    EXPECT_EQ(503, gateway::status_of(error::plugin_disabled));
    EXPECT_EQ(503, gateway::status_of(error::call_timeout));
    EXPECT_EQ(400, gateway::status_of(error::remote_error));
    EXPECT_EQ(403, gateway::status_of(error::master_key_required));
    EXPECT_EQ(401, gateway::status_of(error::invalid_access_token));
    EXPECT_EQ(401, gateway::status_of(error::access_token_expired));
    EXPECT_EQ(401, gateway::status_of(error::user_required));
    EXPECT_EQ(413, gateway::status_of(error::frame_too_large));
    EXPECT_EQ(500, gateway::status_of(error::process_exited));
    EXPECT_EQ(500, gateway::status_of(error::uncaught_error));
}

// Sends a raw request over a socket and returns the whole response.
auto
exchange(const asio::ip::tcp::endpoint& endpoint, const std::string& request) -> std::string {
    asio::io_service loop;
    asio::ip::tcp::socket socket(loop);

    socket.connect(asio::ip::tcp::endpoint(asio::ip::address::from_string("127.0.0.1"), endpoint.port()));

    asio::write(socket, asio::buffer(request));

    std::string response;
    std::array<char, 1024> buffer;
    std::error_code ec;

    while(true) {
        const auto size = socket.read_some(asio::buffer(buffer), ec);

        if(ec) {
            break;
        }

        response.append(buffer.data(), size);
    }

    return response;
}

TEST_F(http_gateway, serves_connections) {
    http->start();

    const std::string body = R"({"action": "note:echo", "api_key": "secret", "n": 1})";

    const auto response = exchange(http->endpoint(),
        "POST / HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "\r\n" + body);

    EXPECT_TRUE(boost::starts_with(response, "HTTP/1.1 200 OK\r\n")) << response;

    const auto payload = json::parse(response.substr(response.find("\r\n\r\n") + 4));

    EXPECT_EQ(1, payload.as_object().at("result").as_object().at("n").as_int());

    const auto malformed = exchange(http->endpoint(), "GARBAGE\r\n\r\n");

    EXPECT_TRUE(boost::starts_with(malformed, "HTTP/1.1 400 Bad Request\r\n")) << malformed;

    http->stop(std::chrono::milliseconds(1000));
}

TEST_F(http_gateway, drains_in_flight_requests) {
    http->start();

    const auto endpoint = http->endpoint();

    std::string response;

    std::thread client([&] {
        response = exchange(endpoint, "POST /note/slow HTTP/1.1\r\nContent-Length: 0\r\n\r\n");
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    http->stop(std::chrono::milliseconds(2000));

    client.join();

    EXPECT_TRUE(boost::starts_with(response, "HTTP/1.1 200 OK\r\n")) << response;
}

auto
body_of(const std::string& response) -> dynamic_t {
    return json::parse(response.substr(response.find("\r\n\r\n") + 4));
}

TEST_F(http_gateway, chunked_body) {
    http->start();

    const auto response = exchange(http->endpoint(),
        "POST / HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "a\r\n"
        "{\"action\":\r\n"
        "e\r\n"
        "\"record:save\"}\r\n"
        "0\r\n"
        "\r\n");

    ASSERT_TRUE(boost::starts_with(response, "HTTP/1.1 200 OK\r\n")) << response;
    EXPECT_EQ("record:save", body_of(response).as_object().at("result").as_string());

    http->stop(std::chrono::milliseconds(1000));
}

TEST_F(http_gateway, expect_continue) {
    http->start();

    const std::string body = R"({"action": "record:save"})";

    asio::io_service loop;
    asio::ip::tcp::socket socket(loop);

    socket.connect(asio::ip::tcp::endpoint(asio::ip::address::from_string("127.0.0.1"), http->endpoint().port()));

    asio::write(socket, asio::buffer(
        "POST / HTTP/1.1\r\n"
        "Expect: 100-continue\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "\r\n"));

    const std::string expected = "HTTP/1.1 100 Continue\r\n\r\n";

    std::string interim(expected.size(), '\0');
    asio::read(socket, asio::buffer(&interim[0], interim.size()));

    EXPECT_EQ(expected, interim);

    asio::write(socket, asio::buffer(body));

    std::string response;
    std::array<char, 1024> buffer;
    std::error_code ec;

    while(true) {
        const auto size = socket.read_some(asio::buffer(buffer), ec);

        if(ec) {
            break;
        }

        response.append(buffer.data(), size);
    }

    ASSERT_TRUE(boost::starts_with(response, "HTTP/1.1 200 OK\r\n")) << response;
    EXPECT_EQ("record:save", body_of(response).as_object().at("result").as_string());

    http->stop(std::chrono::milliseconds(1000));
}

TEST_F(http_gateway, header_names_ignore_case) {
    http->start();

    const auto response = exchange(http->endpoint(),
        "POST /note/echo HTTP/1.1\r\n"
        "x-ourd-api-key: master\r\n"
        "content-length: 2\r\n"
        "\r\n"
        "{}");

    EXPECT_TRUE(boost::starts_with(response, "HTTP/1.1 200 OK\r\n")) << response;

    request_t::header_map_t headers;
    headers["X-OURD-API-KEY"] = "secret";

    EXPECT_EQ(1u, headers.count("x-ourd-api-key"));
    EXPECT_EQ(200, http->process("POST", "/note/echo", headers, "{}").status);

    http->stop(std::chrono::milliseconds(1000));
}

TEST_F(http_gateway, deeply_nested_body) {
    const auto direct = post("/", std::string(100000, '[') + "]");

    EXPECT_EQ(400, direct.status);
    EXPECT_EQ("malformed_request", error_name(direct));

    http->start();

    const std::string body = std::string(100000, '[') + std::string(100000, ']');

    const auto response = exchange(http->endpoint(),
        "POST / HTTP/1.1\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "\r\n" + body);

    ASSERT_TRUE(boost::starts_with(response, "HTTP/1.1 400 Bad Request\r\n")) << response.substr(0, 64);
    EXPECT_EQ("malformed_request",
        body_of(response).as_object().at("error").as_object().at("name").as_string());

    http->stop(std::chrono::milliseconds(1000));
}

TEST_F(http_gateway, oversized_body) {
    http->start();

    const auto response = exchange(http->endpoint(),
        "POST / HTTP/1.1\r\n"
        "Content-Length: 999999999\r\n"
        "\r\n");

    EXPECT_TRUE(boost::starts_with(response, "HTTP/1.1 413 Payload Too Large\r\n")) << response;

    http->stop(std::chrono::milliseconds(1000));
}

TEST_F(http_gateway, slow_handlers_do_not_block_io) {
    http->start();

    const auto endpoint = http->endpoint();

    // Twice as many sleeping requests as there are I/O threads.
    std::vector<std::string> responses(4);
    std::vector<std::thread> clients;

    for(size_t i = 0; i < responses.size(); ++i) {
        clients.emplace_back([&, i] {
            responses[i] = exchange(endpoint, "POST /note/nap HTTP/1.1\r\nContent-Length: 0\r\n\r\n");
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    const auto started = std::chrono::steady_clock::now();
    const auto home = exchange(endpoint, "POST / HTTP/1.1\r\nContent-Length: 0\r\n\r\n");
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(boost::starts_with(home, "HTTP/1.1 200 OK\r\n")) << home;
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));

    for(auto it = clients.begin(); it != clients.end(); ++it) {
        it->join();
    }

    for(auto it = responses.begin(); it != responses.end(); ++it) {
        EXPECT_TRUE(boost::starts_with(*it, "HTTP/1.1 200 OK\r\n")) << *it;
    }

    http->stop(std::chrono::milliseconds(2000));
}

} // namespace
} // namespace ourd
