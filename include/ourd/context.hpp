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

#ifndef OURD_CONTEXT_HPP
#define OURD_CONTEXT_HPP

#include "ourd/common.hpp"

#include <blackhole/attributes.hpp>

namespace ourd {

class context_t {
public:
    virtual
    ~context_t() = default;

    /// Creates a logger which tags every record with the given source.
    virtual
    std::unique_ptr<logging::logger_t>
    log(const std::string& source) = 0;

    virtual
    std::unique_ptr<logging::logger_t>
    log(const std::string& source, blackhole::attributes_t attributes) = 0;

    virtual
    api::repository_t&
    repository() const = 0;

    virtual
    const config_t&
    config() const = 0;
};

/// Creates a context with builtin components registered in its repository.
std::unique_ptr<context_t>
make_context(std::unique_ptr<config_t> config, std::unique_ptr<logging::logger_t> log);

} // namespace ourd

#endif
