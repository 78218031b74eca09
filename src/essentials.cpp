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

#include "ourd/detail/essentials.hpp"

#include "ourd/detail/storage/void.hpp"
#include "ourd/detail/token_store/files.hpp"
#include "ourd/detail/token_store/void.hpp"
#include "ourd/detail/transport/exec.hpp"

void
ourd::essentials::initialize(api::repository_t& repository) {
    repository.insert<storage::void_t>("void");
    repository.insert<token_store::void_t>("void");
    repository.insert<token_store::files_t>("fs");
    repository.insert<transport::exec_t>("exec");
}
