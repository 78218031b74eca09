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

#include "ourd/api/handler.hpp"

using namespace ourd;
using namespace ourd::api;

namespace {

class callable_handler_t:
    public handler_t
{
    const std::function<dynamic_t(request_t&)> callable;

public:
    explicit
    callable_handler_t(std::function<dynamic_t(request_t&)> callable_):
        callable(std::move(callable_))
    { }

    virtual
    dynamic_t
    handle(request_t& request) {
        return callable(request);
    }
};

class callable_preprocessor_t:
    public preprocessor_t
{
    const std::function<void(request_t&)> callable;

public:
    explicit
    callable_preprocessor_t(std::function<void(request_t&)> callable_):
        callable(std::move(callable_))
    { }

    virtual
    void
    process(request_t& request) {
        callable(request);
    }
};

} // namespace

std::shared_ptr<handler_t>
ourd::api::make_handler(std::function<dynamic_t(request_t&)> callable) {
    return std::make_shared<callable_handler_t>(std::move(callable));
}

std::shared_ptr<preprocessor_t>
ourd::api::make_preprocessor(std::function<void(request_t&)> callable) {
    return std::make_shared<callable_preprocessor_t>(std::move(callable));
}
