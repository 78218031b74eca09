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

#include "ourd/context.hpp"

#include "ourd/context/config.hpp"
#include "ourd/detail/essentials.hpp"
#include "ourd/logging.hpp"
#include "ourd/repository.hpp"

#include <blackhole/logger.hpp>
#include <blackhole/wrapper.hpp>

namespace ourd {

class context_impl_t : public context_t {
    // The root logger, all the other loggers are wrappers around this one.
    std::unique_ptr<logging::logger_t> m_log;

    std::unique_ptr<config_t> m_config;

    // NOTE: This is the first object in the component tree, all the other dynamic components, be it
    // storages or transports, have to be declared after this one.
    std::unique_ptr<api::repository_t> m_repository;

public:
    context_impl_t(std::unique_ptr<config_t> config, std::unique_ptr<logging::logger_t> log):
        m_log(std::move(log)),
        m_config(std::move(config))
    {
        m_repository.reset(new api::repository_t(this->log("repository")));

        const auto core = this->log("core");

        OURD_LOG_INFO(core, "initializing the core");

        // Load the builtin components.
        essentials::initialize(*m_repository);
    }

    ~context_impl_t() {
        m_repository.reset();
    }

    std::unique_ptr<logging::logger_t>
    log(const std::string& source) {
        return log(source, blackhole::attributes_t());
    }

    std::unique_ptr<logging::logger_t>
    log(const std::string& source, blackhole::attributes_t attributes) {
        attributes.insert(attributes.begin(), {"source", {source}});

        return std::unique_ptr<logging::logger_t>(new blackhole::wrapper_t(*m_log, std::move(attributes)));
    }

    api::repository_t&
    repository() const {
        return *m_repository;
    }

    const config_t&
    config() const {
        return *m_config;
    }
};

std::unique_ptr<context_t>
make_context(std::unique_ptr<config_t> config, std::unique_ptr<logging::logger_t> log) {
    return std::unique_ptr<context_t>(new context_impl_t(std::move(config), std::move(log)));
}

} // namespace ourd
