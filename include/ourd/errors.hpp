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

#ifndef OURD_ERRORS_HPP
#define OURD_ERRORS_HPP

#include <blackhole/extensions/format.hpp>

#include <string>
#include <system_error>
#include <type_traits>

namespace ourd {

// Message formatting for exceptions and log lines. A malformed pattern yields a marker message
// instead of an exception, so that reporting an error never raises another one.
template<class... Args>
inline
std::string
format(const std::string& pattern, const Args&... args) {
    try {
        return blackhole::fmt::format(pattern, args...);
    } catch(const blackhole::fmt::FormatError& e) {
        return "<unable to format '" + pattern + "' - " + e.what() + ">";
    }
}

namespace error {

enum transport_errors {
    parse_error = 1,
    frame_too_large
};

enum dispatch_errors {
    unknown_action = 1,
    malformed_request,
    method_not_allowed,
    uncaught_error
};

enum registry_errors {
    duplicate_action = 1,
    duplicate_lambda,
    duplicate_timer,
    duplicate_component,
    component_not_found,
    registry_sealed
};

enum security_errors {
    missing_api_key = 1,
    invalid_api_key,
    master_key_required,
    invalid_access_token,
    access_token_expired,
    user_required
};

enum plugin_errors {
    handshake_timeout = 1,
    handshake_failed,
    process_exited,
    call_timeout,
    protocol_violation,
    pool_exhausted,
    plugin_disabled,
    remote_error,
    spawn_failed,
    pool_shutdown,
    invalid_transition
};

enum hook_errors {
    unknown_trigger = 1,
    unsupported_schedule
};

auto
make_error_code(transport_errors code) -> std::error_code;

auto
make_error_code(dispatch_errors code) -> std::error_code;

auto
make_error_code(registry_errors code) -> std::error_code;

auto
make_error_code(security_errors code) -> std::error_code;

auto
make_error_code(plugin_errors code) -> std::error_code;

auto
make_error_code(hook_errors code) -> std::error_code;

auto
plugin_category() -> const std::error_category&;

auto
security_category() -> const std::error_category&;

// Generic exception

struct error_t:
    public std::system_error
{
    static const std::error_code kInvalidArgumentErrorCode;

    template<class... Args>
    error_t(const std::string& fmt, const Args&... args):
        std::system_error(kInvalidArgumentErrorCode, ourd::format(fmt, args...))
    {}

    template<class... Args>
    error_t(std::error_code ec, const std::string& fmt, const Args&... args):
        std::system_error(std::move(ec), ourd::format(fmt, args...))
    {}

    template<class E, class... Args, class = typename std::enable_if<
        std::is_error_code_enum<E>::value || std::is_error_condition_enum<E>::value
    >::type>
    error_t(const E err, const std::string& fmt, const Args&... args):
        std::system_error(make_error_code(err), ourd::format(fmt, args...))
    {}
};

std::string
to_string(const std::system_error& e);

// Symbolic name of a project error code, e.g. "unknown_action". Empty for foreign categories.
std::string
name(const std::error_code& ec);

} // namespace error

using error::error_t;

} // namespace ourd

namespace std {

template<>
struct is_error_code_enum<ourd::error::transport_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<ourd::error::dispatch_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<ourd::error::registry_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<ourd::error::security_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<ourd::error::plugin_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<ourd::error::hook_errors>:
    public true_type
{ };

} // namespace std

#endif
