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

#include "ourd/common.hpp"
#include "ourd/context.hpp"
#include "ourd/context/config.hpp"
#include "ourd/defaults.hpp"
#include "ourd/dynamic.hpp"
#include "ourd/errors.hpp"
#include "ourd/logging.hpp"
#include "ourd/server.hpp"

#include "ourd/detail/runtime/logging.hpp"

#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include <blackhole/attribute.hpp>
#include <blackhole/attributes.hpp>
#include <blackhole/config/json.hpp>
#include <blackhole/extensions/facade.hpp>
#include <blackhole/logger.hpp>
#include <blackhole/record.hpp>
#include <blackhole/registry.hpp>
#include <blackhole/root.hpp>
#include <blackhole/wrapper.hpp>

#include <cstdlib>
#include <iostream>
#include <sstream>

using namespace ourd;

namespace po = boost::program_options;

int
main(int argc, char* argv[]) {
    po::options_description general_options("General options");
    po::options_description hidden_options;
    po::positional_options_description positional;
    po::variables_map vm;

    general_options.add_options()
        ("help,h", "show this message")
        ("logging,l", po::value<std::string>()->default_value("core"), "logging backend")
        ("version,v", "show version and build information");

    hidden_options.add_options()
        ("configuration", po::value<std::string>(), "location of the configuration file");

    positional.add("configuration", 1);

    po::options_description options;
    options.add(general_options).add(hidden_options);

    try {
        po::store(po::command_line_parser(argc, argv).options(options).positional(positional).run(), vm);
        po::notify(vm);
    } catch(const po::error& e) {
        std::cerr << ourd::format("ERROR: {}.", e.what()) << std::endl;
        return EXIT_FAILURE;
    }

    const auto usage = ourd::format("USAGE: {} [options] [<configuration>]", argv[0]);

    if(vm.count("help")) {
        std::cout << usage << std::endl;
        std::cout << general_options;
        return EXIT_SUCCESS;
    }

    if(vm.count("version")) {
        std::cout << ourd::format("Ourd {}.{}.{}", OURD_VERSION_MAJOR, OURD_VERSION_MINOR,
            OURD_VERSION_RELEASE) << std::endl;
        return EXIT_SUCCESS;
    }

    // Validation

    std::string source;

    if(vm.count("configuration")) {
        source = vm["configuration"].as<std::string>();
    } else if(const char* env = std::getenv(defaults::config_variable)) {
        source = env;
    }

    if(source.empty()) {
        std::cout << usage << std::endl;
        return EXIT_SUCCESS;
    }

    // Startup

    std::unique_ptr<config_t> config;

    try {
        config = make_config(source);
    } catch(const std::system_error& e) {
        std::cerr << ourd::format("ERROR: unable to initialize the configuration - {}.", error::to_string(e))
                  << std::endl;
        return EXIT_FAILURE;
    }

    // Logging

    const auto backend = vm["logging"].as<std::string>();

    std::unique_ptr<blackhole::root_logger_t> root;
    std::unique_ptr<logging::logger_t> logger;

    auto registry = blackhole::registry::configured();
    registry->add<logging::console_t>();

    try {
        std::stringstream stream;
        stream << boost::lexical_cast<std::string>(config->logging.loggers);

        auto log = registry->builder<blackhole::config::json_t>(stream)
            .build(backend);

        root.reset(new blackhole::root_logger_t(std::move(log)));
        logger.reset(new blackhole::wrapper_t(*root, {}));
    } catch(const std::exception& e) {
        std::cerr << "ERROR: unable to initialize the logging: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    const auto severity = config->logging.severity;

    root->filter([=](const blackhole::record_t& record) -> bool {
        return record.severity() >= severity;
    });

    OURD_LOG_INFO(logger, "initializing the server");

    std::unique_ptr<context_t> context;

    try {
        context = make_context(std::move(config), std::move(logger));
    } catch(const std::system_error& e) {
        OURD_LOG_ERROR(root, "unable to initialize the context - {}", error::to_string(e));
        return EXIT_FAILURE;
    }

    std::unique_ptr<server_t> server;

    try {
        server.reset(new server_t(std::move(context)));
    } catch(const std::system_error& e) {
        OURD_LOG_ERROR(root, "unable to initialize the server - {}", error::to_string(e));
        return EXIT_FAILURE;
    }

    try {
        server->run();
    } catch(const std::system_error& e) {
        OURD_LOG_ERROR(root, "unable to run the server - {}", error::to_string(e));
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
