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

#include "ourd/detail/preprocessors.hpp"

#include "ourd/errors.hpp"
#include "ourd/request.hpp"

#include <boost/date_time/posix_time/posix_time_types.hpp>

using namespace ourd;
using namespace ourd::preprocessor;

api_key_t::api_key_t(const config_t::app_t& app):
    m_api_key(app.api_key),
    m_master_key(app.master_key)
{ }

api_key_t::api_key_t(std::string api_key, std::string master_key):
    m_api_key(std::move(api_key)),
    m_master_key(std::move(master_key))
{ }

void
api_key_t::process(request_t& request) {
    std::string key;

    const auto& field = request.field("api_key");

    if(field.is_string()) {
        key = field.as_string();
    } else if(auto header = request.header("X-Ourd-Api-Key")) {
        key = *header;
    }

    if(key.empty()) {
        request.fail(error::missing_api_key);
        return;
    }

    if(!m_master_key.empty() && key == m_master_key) {
        request.principal.kind = principal_t::kind_t::master;
    } else if(key == m_api_key) {
        request.principal.kind = principal_t::kind_t::api_key;
    } else {
        request.fail(error::invalid_api_key);
    }
}

authenticator_t::authenticator_t(const config_t::app_t& app):
    m_api_key(app)
{ }

authenticator_t::authenticator_t(std::string api_key, std::string master_key):
    m_api_key(std::move(api_key), std::move(master_key))
{ }

void
authenticator_t::process(request_t& request) {
    std::string token;

    const auto& field = request.field("access_token");

    if(field.is_string()) {
        token = field.as_string();
    } else if(auto header = request.header("X-Ourd-Access-Token")) {
        token = *header;
    }

    if(token.empty()) {
        m_api_key.process(request);
        return;
    }

    boost::optional<api::token_t> stored;

    if(request.tokens) {
        stored = request.tokens->get(token);
    }

    if(!stored) {
        request.fail(error::invalid_access_token);
        return;
    }

    if(stored->expired(boost::posix_time::second_clock::universal_time())) {
        request.fail(error::access_token_expired);
        return;
    }

    request.principal.kind = principal_t::kind_t::user;
    request.principal.user_id = stored->user_id;
}

tokens_t::tokens_t(api::token_store_ptr tokens):
    m_tokens(std::move(tokens))
{ }

void
tokens_t::process(request_t& request) {
    request.tokens = m_tokens;
}

connection_t::connection_t(api::storage_ptr storage):
    m_storage(std::move(storage))
{ }

void
connection_t::process(request_t& request) {
    request.connection = m_storage->open();
}

hooks_t::hooks_t(const hook::registry_t& hooks):
    m_hooks(hooks)
{ }

void
hooks_t::process(request_t& request) {
    request.hooks = &m_hooks;
}

void
require_master_t::process(request_t& request) {
    if(request.principal.kind != principal_t::kind_t::master) {
        request.fail(error::master_key_required);
    }
}

void
require_user_t::process(request_t& request) {
    if(request.principal.kind != principal_t::kind_t::user &&
       request.principal.kind != principal_t::kind_t::master)
    {
        request.fail(error::user_required);
    }
}
