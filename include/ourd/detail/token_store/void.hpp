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


#ifndef OURD_VOID_TOKEN_STORE_HPP
#define OURD_VOID_TOKEN_STORE_HPP

#include "ourd/api/token_store.hpp"

namespace ourd { namespace token_store {

// Token store which knows no tokens, so only the api key can authenticate a request.

class void_t:
    public api::token_store_t
{
    const std::unique_ptr<logging::logger_t> m_log;

public:
    void_t(context_t& context, const std::string& name, const dynamic_t& args);

    virtual
    auto
    get(const std::string& access_token) -> boost::optional<api::token_t>;

    virtual
    void
    put(const api::token_t& token);

    virtual
    void
    remove(const std::string& access_token);
};

}} // namespace ourd::token_store

#endif
