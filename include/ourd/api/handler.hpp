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

#ifndef OURD_HANDLER_API_HPP
#define OURD_HANDLER_API_HPP

#include "ourd/common.hpp"
#include "ourd/dynamic.hpp"

#include <functional>

namespace ourd { namespace api {

// Produces the result for an action once every preprocessor of its chain has passed. A handler
// reports an error either by throwing or by failing the request.

struct handler_t {
    virtual
   ~handler_t() {
        // Empty.
    }

    virtual
    dynamic_t
    handle(request_t& request) = 0;
};

// Ordered gate which runs before the handler. Aborts the chain by failing the request.

struct preprocessor_t {
    virtual
   ~preprocessor_t() {
        // Empty.
    }

    virtual
    void
    process(request_t& request) = 0;
};

typedef std::vector<std::shared_ptr<preprocessor_t>> chain_t;

// Adapters for plain callables.

std::shared_ptr<handler_t>
make_handler(std::function<dynamic_t(request_t&)> callable);

std::shared_ptr<preprocessor_t>
make_preprocessor(std::function<void(request_t&)> callable);

}} // namespace ourd::api

#endif
