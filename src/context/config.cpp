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


#include "ourd/context/config.hpp"

#include "ourd/defaults.hpp"
#include "ourd/errors.hpp"
#include "ourd/json.hpp"

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/thread/thread.hpp>

#include <algorithm>
#include <iterator>
#include <set>

namespace ourd {

namespace fs = boost::filesystem;

namespace {

auto
read(const std::string& path) -> dynamic_t {
    const auto status = fs::status(path);

    if(!fs::exists(status) || !fs::is_regular_file(status)) {
        throw error_t("configuration file path is invalid");
    }

    fs::ifstream stream(path);

    if(!stream) {
        throw error_t("unable to read configuration file");
    }

    const std::string content{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};

    dynamic_t root;

    try {
        root = json::parse(content, json::mode_t::relaxed);
    } catch(const std::system_error& e) {
        throw error_t("configuration file is corrupted - {}", e.what());
    }

    if(!root.is_object()) {
        throw error_t("configuration file must contain an object");
    }

    if(root.as_object().at("version", 0).as_uint() != config_t::version()) {
        throw error_t("configuration file version is invalid");
    }

    static const std::set<std::string> known = {
        "version",
        "app",
        "http",
        "logging",
        "storage",
        "token_store",
        "plugins"
    };

    for(auto it = root.as_object().begin(); it != root.as_object().end(); ++it) {
        if(!known.count(it->first)) {
            throw error_t("unknown configuration section \"{}\"", it->first);
        }

        if(it->first != "version" && !it->second.is_object()) {
            throw error_t("configuration section \"{}\" must be an object", it->first);
        }
    }

    return root;
}

auto
section(const dynamic_t& root, const char* name) -> const dynamic_t::object_t& {
    return root.as_object().at(name, dynamic_t::empty_object).as_object();
}

auto
app_from(const dynamic_t::object_t& source) -> config_t::app_t {
    if(source.count("name") == 0 || !source.at("name").is_string()) {
        throw error_t("missing \"app.name\" field in configuration file");
    }

    config_t::app_t result;

    result.name       = source.at("name").as_string();
    result.api_key    = source.at("api_key", dynamic_t::empty_string).as_string();
    result.master_key = source.at("master_key", dynamic_t::empty_string).as_string();

    if(result.api_key.empty()) {
        throw error_t("\"app.api_key\" must not be empty");
    }

    if(!result.master_key.empty() && result.master_key == result.api_key) {
        throw error_t("\"app.master_key\" must differ from \"app.api_key\"");
    }

    return result;
}

auto
http_from(const dynamic_t::object_t& source) -> config_t::http_t {
    config_t::http_t result;

    result.endpoint = source.at("endpoint", defaults::endpoint).as_string();

    const auto port = source.at("port", defaults::port).as_uint();

    if(port > 65535) {
        throw error_t("invalid configuration for \"http.port\" - {}", port);
    }

    result.port          = static_cast<port_t>(port);
    result.pool          = source.at("pool", std::max(boost::thread::hardware_concurrency(), 1u) * 2).as_uint();
    result.drain_timeout = std::chrono::milliseconds(source.at("drain_timeout", defaults::drain_timeout).as_uint());

    if(result.pool == 0) {
        throw error_t("http I/O pool size must be positive");
    }

    return result;
}

auto
logging_from(const dynamic_t::object_t& source) -> config_t::logging_t {
    if(source.count("loggers") == 0) {
        throw error_t("missing \"logging.loggers\" field in configuration file");
    }

    static const std::map<std::string, logging::priorities> priorities{
        {"debug",   logging::debug  },
        {"info",    logging::info   },
        {"warning", logging::warning},
        {"error",   logging::error  }
    };

    const auto severity = source.at("severity", "info").as_string();
    const auto it = priorities.find(severity);

    if(it == priorities.end()) {
        throw error_t("severity \"{}\" not found", severity);
    }

    return config_t::logging_t{source.at("loggers"), it->second};
}

auto
component_from(const dynamic_t& source, const std::string& type) -> config_t::component_t {
    config_t::component_t result{
        source.as_object().at("type", type).as_string(),
        source.as_object().at("args", dynamic_t::empty_object)
    };

    if(!result.args.is_object()) {
        throw error_t("component arguments must be an object - {}", boost::lexical_cast<std::string>(result.args));
    }

    return result;
}

} // namespace

auto
config_t::version() -> unsigned {
    return 1;
}

std::unique_ptr<config_t>
make_config(const std::string& source) {
    const auto root = read(source);

    std::unique_ptr<config_t> config(new config_t());

    config->app     = app_from(section(root, "app"));
    config->http    = http_from(section(root, "http"));
    config->logging = logging_from(section(root, "logging"));

    config->storage = component_from(root.as_object().at("storage", dynamic_t::empty_object), defaults::storage);
    config->token_store = component_from(root.as_object().at("token_store", dynamic_t::empty_object),
        defaults::token_store);

    const auto& plugins = section(root, "plugins");

    for(auto it = plugins.begin(); it != plugins.end(); ++it) {
        if(!it->second.is_object()) {
            throw error_t("invalid configuration for plugin \"{}\" - {}", it->first,
                boost::lexical_cast<std::string>(it->second));
        }

        config->plugins[it->first] = component_from(it->second, defaults::transport);
    }

    return config;
}

} // namespace ourd
