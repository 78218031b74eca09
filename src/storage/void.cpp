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

#include "ourd/detail/storage/void.hpp"

#include "ourd/context.hpp"
#include "ourd/logging.hpp"

#include <blackhole/logger.hpp>

using namespace ourd;
using namespace ourd::storage;

namespace {

struct void_connection_t:
    public api::connection_t
{
    const std::string name;

    explicit
    void_connection_t(std::string name_):
        name(std::move(name_))
    { }

    virtual
    auto
    storage() const -> const std::string& {
        return name;
    }
};

} // namespace

void_t::void_t(context_t& context, const std::string& name, const dynamic_t& args):
    category_type(context, name, args),
    m_log(context.log(format("storage/{}", name))),
    m_name(name)
{
    OURD_LOG_INFO(m_log, "using void storage, records will not be persisted");
}

std::shared_ptr<api::connection_t>
void_t::open() {
    return std::make_shared<void_connection_t>(m_name);
}
