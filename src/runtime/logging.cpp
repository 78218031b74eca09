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

#include "ourd/detail/runtime/logging.hpp"

#include "ourd/common.hpp"

#include <blackhole/config/node.hpp>
#include <blackhole/config/option.hpp>
#include <blackhole/record.hpp>
#include <blackhole/sink.hpp>
#include <blackhole/sink/console.hpp>
#include <blackhole/termcolor.hpp>

#include <stdexcept>

namespace {

typedef blackhole::builder<blackhole::sink::console_t> builder_type;

auto
build(builder_type&& builder, const std::string& stream) -> std::unique_ptr<blackhole::sink_t> {
    if(stream == "stdout") {
        return std::move(builder).stdout().build();
    }

    return std::move(builder).stderr().build();
}

} // namespace

namespace blackhole {

auto
factory<ourd::logging::console_t>::type() const noexcept -> const char* {
    return "console";
}

// Options are "stream", either "stdout" or "stderr" (the default), and "colored", true by default.
auto
factory<ourd::logging::console_t>::from(const config::node_t& config) const -> std::unique_ptr<sink_t> {
    const std::string stream = config["stream"].to_string().get_value_or("stderr");
    const bool colored = config["colored"].to_bool().get_value_or(true);

    if(stream != "stdout" && stream != "stderr") {
        throw std::invalid_argument("console sink stream must be either \"stdout\" or \"stderr\"");
    }

    if(!colored) {
        return build(builder_type(), stream);
    }

    return build(builder_type()
        .colorize(ourd::logging::debug, termcolor_t())
        .colorize(ourd::logging::info, termcolor_t::blue())
        .colorize(ourd::logging::warning, termcolor_t::yellow())
        .colorize(ourd::logging::error, termcolor_t::red()), stream);
}

}  // namespace blackhole
