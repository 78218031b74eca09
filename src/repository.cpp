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


#include "ourd/repository.hpp"

#include "ourd/logging.hpp"

#include <blackhole/logger.hpp>

using namespace ourd;
using namespace ourd::api;

repository_t::repository_t(std::unique_ptr<logging::logger_t> log):
    m_log(std::move(log))
{ }

repository_t::~repository_t() {
    // Factories may own cached components, which might still log something.
    m_factories.clear();
}

auto
repository_t::find(const std::string& category, const std::string& name) const -> const boost::any* {
    auto factories = m_factories.find(category);

    if(factories == m_factories.end()) {
        return nullptr;
    }

    auto it = factories->second.find(name);

    return it != factories->second.end() ? &it->second : nullptr;
}

auto
repository_t::types(const std::string& category) const -> std::vector<std::string> {
    std::vector<std::string> result;

    auto factories = m_factories.find(category);

    if(factories != m_factories.end()) {
        for(auto it = factories->second.begin(); it != factories->second.end(); ++it) {
            result.push_back(it->first);
        }
    }

    return result;
}

void
repository_t::insert(const std::string& category, const std::string& name, boost::any factory) {
    auto& factories = m_factories[category];

    if(factories.count(name)) {
        throw error_t(error::duplicate_component, "{} '{}' has been already registered", category, name);
    }

    OURD_LOG_DEBUG(m_log, "registering {} '{}'", category, name);

    factories[name] = std::move(factory);
}
