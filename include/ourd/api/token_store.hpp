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


#ifndef OURD_TOKEN_STORE_API_HPP
#define OURD_TOKEN_STORE_API_HPP

#include "ourd/common.hpp"
#include "ourd/repository.hpp"

#include <boost/date_time/posix_time/ptime.hpp>
#include <boost/optional/optional.hpp>

namespace ourd { namespace api {

/// Access token issued to a user. A token without an expiry time never expires.
struct token_t {
    std::string access_token;
    std::string user_id;
    boost::posix_time::ptime expired_at;

    auto
    expired(const boost::posix_time::ptime& now) const -> bool {
        return !expired_at.is_not_a_date_time() && expired_at <= now;
    }
};

struct token_store_t {
    typedef token_store_t category_type;

    virtual
   ~token_store_t() {
        // Empty.
    }

    /// Empty if no such token has been stored.
    virtual
    auto
    get(const std::string& access_token) -> boost::optional<token_t> = 0;

    virtual
    void
    put(const token_t& token) = 0;

    /// Removing an unknown token is not an error.
    virtual
    void
    remove(const std::string& access_token) = 0;

protected:
    token_store_t(context_t&, const std::string& /* name */, const dynamic_t& /* args */) {
        // Empty.
    }
};

typedef std::shared_ptr<token_store_t> token_store_ptr;

template<>
struct category_traits<token_store_t> {
    typedef token_store_ptr ptr_type;
    typedef std::function<ptr_type(context_t&, const std::string&, const dynamic_t&)> factory_type;

    static
    const char*
    name() {
        return "token store";
    }

    template<class T>
    static
    factory_type
    make() {
        return [](context_t& context, const std::string& name, const dynamic_t& args) -> ptr_type {
            return std::make_shared<T>(context, name, args);
        };
    }
};

}} // namespace ourd::api

#endif
