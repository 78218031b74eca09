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

#ifndef OURD_RUNTIME_LOGGING_HPP
#define OURD_RUNTIME_LOGGING_HPP

#include <blackhole/sink.hpp>

#include <memory>

namespace ourd { namespace logging {

// Tag for the console sink with severity colors, registered in the logging registry as "console".
struct console_t;

}} // namespace ourd::logging

namespace blackhole {
inline namespace v1 {

template<>
class factory<ourd::logging::console_t> : public factory<sink_t> {
public:
    auto type() const noexcept -> const char* override;
    auto from(const config::node_t& config) const -> std::unique_ptr<sink_t> override;
};

}  // namespace v1
}  // namespace blackhole

#endif
