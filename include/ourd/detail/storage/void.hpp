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

#ifndef OURD_VOID_STORAGE_HPP
#define OURD_VOID_STORAGE_HPP

#include "ourd/api/storage.hpp"

namespace ourd { namespace storage {

// Storage which keeps nothing. Used when no storage engine has been configured.

class void_t:
    public api::storage_t
{
    const std::unique_ptr<logging::logger_t> m_log;
    const std::string m_name;

public:
    void_t(context_t& context, const std::string& name, const dynamic_t& args);

    virtual
    std::shared_ptr<api::connection_t>
    open();
};

}} // namespace ourd::storage

#endif
