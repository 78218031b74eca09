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

#include "ourd/logging.hpp"

#include <blackhole/handler.hpp>
#include <blackhole/root.hpp>

#include <vector>

namespace ourd { namespace logging {

auto
make_null_logger() -> std::unique_ptr<logger_t> {
    return std::unique_ptr<logger_t>(
        new blackhole::root_logger_t(std::vector<std::unique_ptr<blackhole::handler_t>>())
    );
}

}} // namespace ourd::logging
