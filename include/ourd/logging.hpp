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

#ifndef OURD_LOGGING_HPP
#define OURD_LOGGING_HPP

#include "ourd/common.hpp"
#include "ourd/errors.hpp"

#include <blackhole/attribute.hpp>
#include <blackhole/attributes.hpp>
#include <blackhole/extensions/facade.hpp>
#include <blackhole/logger.hpp>

#include <boost/core/demangle.hpp>

#include <typeinfo>

#define OURD_LOG(__log__, __severity__, ...) \
    ::ourd::detail::logging::log(__log__, __severity__, __VA_ARGS__)

#define OURD_LOG_DEBUG(__log__, ...) \
    OURD_LOG(__log__, ::ourd::logging::debug, __VA_ARGS__)

#define OURD_LOG_INFO(__log__, ...) \
    OURD_LOG(__log__, ::ourd::logging::info, __VA_ARGS__)

#define OURD_LOG_WARNING(__log__, ...) \
    OURD_LOG(__log__, ::ourd::logging::warning, __VA_ARGS__)

#define OURD_LOG_ERROR(__log__, ...) \
    OURD_LOG(__log__, ::ourd::logging::error, __VA_ARGS__)

namespace ourd { namespace detail { namespace logging {

template<typename T> inline auto logger_ref(T& log) -> T& { return log; }
template<typename T> inline auto logger_ref(T* const log) -> T& { return *log; }
template<typename T> inline auto logger_ref(std::unique_ptr<T>& log) -> T& { return *log; }
template<typename T> inline auto logger_ref(const std::unique_ptr<T>& log) -> T& { return *log; }
template<typename T> inline auto logger_ref(std::shared_ptr<T>& log) -> T& { return *log; }
template<typename T> inline auto logger_ref(const std::shared_ptr<T>& log) -> T& { return *log; }

template<typename Log>
auto
make_facade(Log&& log) -> blackhole::logger_facade<ourd::logging::logger_t> {
    return blackhole::logger_facade<ourd::logging::logger_t>(logger_ref(log));
}

template<typename Log, typename... Args>
auto
log(Log&& log, ourd::logging::priorities severity, const char* message, const Args&... args) -> void {
    make_facade(log).log(severity, message, args...);
}

}}} // namespace ourd::detail::logging

namespace ourd { namespace logging {

// Readable type name for diagnostics.
template<class T>
auto
demangle() -> std::string {
    return boost::core::demangle(typeid(T).name());
}

/// Creates a logger, which drops every record. Used where no sink has been configured yet.
auto
make_null_logger() -> std::unique_ptr<logger_t>;

}} // namespace ourd::logging

#endif
