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

#include "ourd/defaults.hpp"

namespace ourd { namespace defaults {

const char endpoint[] = "0.0.0.0";
const port_t port = 3000;
const unsigned long drain_timeout = 5000;

const char transport[] = "exec";
const char storage[] = "void";
const char token_store[] = "void";

const unsigned long pool_width = 1;
const unsigned long call_timeout = 30000;
const unsigned long handshake_timeout = 5000;
const unsigned long acquire_timeout = 5000;
const unsigned long kill_timeout = 5;

const unsigned long respawn_limit = 5;
const unsigned long respawn_window = 60000;

const size_t frame_limit = 16 * 1024 * 1024;

const size_t json_depth = 128;

const char config_variable[] = "OD_CONFIG";

}} // namespace ourd::defaults
