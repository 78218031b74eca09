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

// Plugin protocol helper for the unit tests. The first argument selects the behavior:
//
//   echo         declares the demo manifest and serves its operations;
//   silent       never replies;
//   exit         exits before the handshake;
//   garbage      replies to the handshake with a line which is not JSON;
//   reject       replies to the handshake with an error;
//   bad-timer    declares a timer with a schedule which cannot be parsed;
//   crash-on-op  completes the handshake and exits on the first operation;
//   no-stderr    closes its standard error, then behaves like echo.

#include "ourd/dynamic.hpp"
#include "ourd/json.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include <unistd.h>

using namespace ourd;

namespace {

const char manifest[] =
    "{"
    "  \"handlers\": ["
    "    \"demo:echo\", \"demo:fail\", \"demo:sleep\", \"demo:pid\", \"demo:exit\","
    "    {\"name\": \"demo:open\", \"key_required\": false},"
    "    {\"name\": \"demo:mine\", \"user_required\": true}"
    "  ],"
    "  \"hooks\": ["
    "    {\"type\": \"note\", \"trigger\": \"before-save\", \"name\": \"stamp\"},"
    "    {\"type\": \"note\", \"trigger\": \"after-save\", \"name\": \"veto\"}"
    "  ],"
    "  \"lambdas\": [\"demo:lambda\"],"
    "  \"timers\": ["
    "    {\"spec\": \"@every 1h\", \"name\": \"tick\"},"
    "    {\"spec\": \"0 0 12 * * MON-FRI\", \"name\": \"noon\"}"
    "  ]"
    "}";

const char bad_timer_manifest[] =
    "{"
    "  \"handlers\": [\"demo:echo\"],"
    "  \"timers\": [{\"spec\": \"@fortnightly\", \"name\": \"tick\"}]"
    "}";

void
reply(const dynamic_t& id, const std::string& kind, const dynamic_t& data) {
    std::cout << json::serialize(dynamic_t::object_t{{"id", id}, {"kind", kind}, {"data", data}}) << std::endl;
}

auto
serve(const std::string& name, const dynamic_t& context, std::string& kind) -> dynamic_t {
    kind = "result";

    if(name == "demo:echo" || name == "demo:open" || name == "demo:mine" || name == "demo:lambda") {
        return context;
    }

    if(name == "demo:fail") {
        kind = "error";

        return dynamic_t::object_t{
            {"message", "refused by plugin"},
            {"code",    "E_DEMO"},
            {"info",    dynamic_t::object_t{{"field", "title"}}}
        };
    }

    if(name == "demo:sleep") {
        const auto ms = context.as_object().at("payload").as_object().at("ms", 100).as_uint();

        std::this_thread::sleep_for(std::chrono::milliseconds(ms));

        return dynamic_t::object_t{{"slept", ms}};
    }

    if(name == "demo:pid") {
        return static_cast<dynamic_t::int_t>(::getpid());
    }

    if(name == "demo:exit") {
        std::exit(EXIT_FAILURE);
    }

    if(name == "stamp") {
        auto record = context.as_object().at("record");
        record.as_object()["stamped"] = true;
        return record;
    }

    if(name == "veto") {
        kind = "error";
        return dynamic_t::object_t{{"message", "vetoed"}};
    }

    if(name == "tick" || name == "noon") {
        return dynamic_t::null;
    }

    kind = "error";

    return dynamic_t::object_t{{"message", "unknown operation " + name}};
}

} // namespace

int
main(int argc, char* argv[]) {
    const std::string mode = argc > 1 ? argv[1] : "echo";

    std::cerr << "protocol helper started in '" << mode << "' mode" << std::endl;

    if(mode == "exit") {
        return EXIT_FAILURE;
    }

    if(mode == "no-stderr") {
        ::close(STDERR_FILENO);
    }

    std::string line;

    while(std::getline(std::cin, line)) {
        if(mode == "silent") {
            continue;
        }

        dynamic_t message;

        try {
            message = json::parse(line);
        } catch(const std::system_error& e) {
            std::cerr << "unable to parse request: " << e.what() << std::endl;
            return EXIT_FAILURE;
        }

        const auto& object = message.as_object();
        const auto& id = object.at("id");

        if(object.at("kind").as_string() == "init") {
            if(mode == "garbage") {
                std::cout << "this is not a protocol message" << std::endl;
            } else if(mode == "reject") {
                reply(id, "error", dynamic_t::object_t{{"message", "not today"}});
            } else if(mode == "bad-timer") {
                reply(id, "result", json::parse(bad_timer_manifest));
            } else {
                reply(id, "result", json::parse(manifest));
            }

            continue;
        }

        if(mode == "crash-on-op") {
            return EXIT_FAILURE;
        }

        std::string kind;
        const auto data = serve(object.at("name").as_string(), object.at("context", dynamic_t::null), kind);

        reply(id, kind, data);
    }

    return EXIT_SUCCESS;
}
