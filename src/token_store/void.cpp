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


#include "ourd/detail/token_store/void.hpp"

#include "ourd/context.hpp"
#include "ourd/logging.hpp"

#include <blackhole/logger.hpp>

using namespace ourd;
using namespace ourd::token_store;

void_t::void_t(context_t& context, const std::string& name, const dynamic_t& args):
    category_type(context, name, args),
    m_log(context.log(format("token_store/{}", name)))
{
    OURD_LOG_INFO(m_log, "using void token store, access tokens will not be accepted");
}

auto
void_t::get(const std::string&) -> boost::optional<api::token_t> {
    return boost::none;
}

void
void_t::put(const api::token_t& token) {
    OURD_LOG_DEBUG(m_log, "dropping token for user '{}'", token.user_id);
}

void
void_t::remove(const std::string&) {
    // Empty.
}
