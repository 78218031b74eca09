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

#ifndef OURD_FORWARDS_HPP
#define OURD_FORWARDS_HPP

#include <memory>
#include <vector>

// Third-party forwards

namespace asio {

class io_service;

} // namespace asio

namespace blackhole {
inline namespace v1 {

class logger_t;

}  // namespace v1
}  // namespace blackhole

namespace ourd {

struct config_t;
class context_t;
class dynamic_t;
class request_t;
class router_t;
class scheduler_t;

typedef unsigned short port_t;

} // namespace ourd

namespace ourd { namespace api {

class repository_t;

struct connection_t;
struct handler_t;
struct preprocessor_t;
struct storage_t;
struct token_store_t;
struct transport_t;

}} // namespace ourd::api

namespace ourd { namespace gateway {

class http_t;

}} // namespace ourd::gateway

namespace ourd { namespace hook {

class registry_t;
class lambdas_t;
class timers_t;

}} // namespace ourd::hook

namespace ourd { namespace io {

class loop_t;

}} // namespace ourd::io

namespace ourd { namespace plugin {

struct descriptor_t;
struct manifest_t;
class pool_t;
class slave_t;

}} // namespace ourd::plugin

namespace ourd { namespace logging {

enum priorities: int {
    debug   =  0,
    info    =  1,
    warning =  2,
    error   =  3
};

// Import the logger in our namespace.
using blackhole::logger_t;

}} // namespace ourd::logging

#endif
