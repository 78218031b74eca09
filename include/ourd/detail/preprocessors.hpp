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

#ifndef OURD_PREPROCESSORS_HPP
#define OURD_PREPROCESSORS_HPP

#include "ourd/api/handler.hpp"
#include "ourd/api/storage.hpp"
#include "ourd/api/token_store.hpp"
#include "ourd/context/config.hpp"

namespace ourd { namespace preprocessor {

// Checks the api key, taken from the "api_key" payload field or the X-Ourd-Api-Key header, and
// establishes the principal. The master key is accepted as well.

class api_key_t:
    public api::preprocessor_t
{
    const std::string m_api_key;
    const std::string m_master_key;

public:
    explicit
    api_key_t(const config_t::app_t& app);

    api_key_t(std::string api_key, std::string master_key);

    virtual
    void
    process(request_t& request);
};

// Authenticates the request by its access token, taken from the "access_token" payload field or the
// X-Ourd-Access-Token header, which establishes the user principal. Requests without a token are
// checked against the api key instead. Needs the token store to be attached first.

class authenticator_t:
    public api::preprocessor_t
{
    api_key_t m_api_key;

public:
    explicit
    authenticator_t(const config_t::app_t& app);

    authenticator_t(std::string api_key, std::string master_key);

    virtual
    void
    process(request_t& request);
};

class tokens_t:
    public api::preprocessor_t
{
    const api::token_store_ptr m_tokens;

public:
    explicit
    tokens_t(api::token_store_ptr tokens);

    virtual
    void
    process(request_t& request);
};

// Opens a storage connection for the request.

class connection_t:
    public api::preprocessor_t
{
    const api::storage_ptr m_storage;

public:
    explicit
    connection_t(api::storage_ptr storage);

    virtual
    void
    process(request_t& request);
};

class hooks_t:
    public api::preprocessor_t
{
    const hook::registry_t& m_hooks;

public:
    explicit
    hooks_t(const hook::registry_t& hooks);

    virtual
    void
    process(request_t& request);
};

class require_master_t:
    public api::preprocessor_t
{
public:
    virtual
    void
    process(request_t& request);
};

// Lets through authenticated users and the master key only.

class require_user_t:
    public api::preprocessor_t
{
public:
    virtual
    void
    process(request_t& request);
};

}} // namespace ourd::preprocessor

#endif
