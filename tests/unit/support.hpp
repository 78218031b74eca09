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

#ifndef OURD_TESTS_SUPPORT_HPP
#define OURD_TESTS_SUPPORT_HPP

#include "ourd/context.hpp"
#include "ourd/context/config.hpp"
#include "ourd/logging.hpp"

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <string>

namespace ourd { namespace testing {

// Keeps the configuration in a temporary file for as long as it lives.
class config_file_t {
    boost::filesystem::path m_path;

public:
    explicit
    config_file_t(const std::string& content):
        m_path(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("ourd-%%%%-%%%%.json"))
    {
        boost::filesystem::ofstream stream(m_path);
        stream << content;
    }

   ~config_file_t() {
        boost::system::error_code ignored;
        boost::filesystem::remove(m_path, ignored);
    }

    auto
    path() const -> std::string {
        return m_path.string();
    }
};

// Temporary directory, removed with everything in it.
class temp_directory_t {
    boost::filesystem::path m_path;

public:
    temp_directory_t():
        m_path(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("ourd-%%%%-%%%%"))
    {
        boost::filesystem::create_directories(m_path);
    }

   ~temp_directory_t() {
        boost::system::error_code ignored;
        boost::filesystem::remove_all(m_path, ignored);
    }

    auto
    path() const -> const boost::filesystem::path& {
        return m_path;
    }
};

inline
auto
make_config(const std::string& content) -> std::unique_ptr<config_t> {
    config_file_t file(content);
    return ourd::make_config(file.path());
}

inline
auto
make_context(const std::string& content) -> std::unique_ptr<context_t> {
    return ourd::make_context(make_config(content), logging::make_null_logger());
}

// Application keys are "secret" and "master", the gateway binds to any free loopback port.
inline
auto
config(const std::string& plugins = "{}") -> std::string {
    return
        "{"
        "  \"version\": 1,"
        "  \"app\": {\"name\": \"test\", \"api_key\": \"secret\", \"master_key\": \"master\"},"
        "  \"http\": {\"endpoint\": \"127.0.0.1\", \"port\": 0, \"pool\": 2, \"drain_timeout\": 1000},"
        "  \"logging\": {\"loggers\": {}},"
        "  \"plugins\": " + plugins +
        "}";
}

// Plugin configuration entry for the protocol helper executable running in the given mode.
inline
auto
plugin(const std::string& mode, size_t pool = 1) -> std::string {
    return
        "{"
        "  \"type\": \"exec\","
        "  \"args\": {"
        "    \"path\": \"" OURD_TEST_PLUGIN "\","
        "    \"argv\": [\"" + mode + "\"],"
        "    \"pool\": " + std::to_string(pool) + ","
        "    \"timeout\": 2000,"
        "    \"handshake\": 1000,"
        "    \"acquire\": 1000,"
        "    \"kill\": 1"
        "  }"
        "}";
}

}} // namespace ourd::testing

#endif
