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

#ifndef OURD_DEFAULTS_HPP
#define OURD_DEFAULTS_HPP

#include "ourd/common.hpp"

namespace ourd { namespace defaults {

// Gateway defaults.

extern const char endpoint[];
extern const port_t port;
extern const unsigned long drain_timeout;

// Plugin defaults.

extern const char transport[];
extern const char storage[];
extern const char token_store[];

extern const unsigned long pool_width;
extern const unsigned long call_timeout;
extern const unsigned long handshake_timeout;
extern const unsigned long acquire_timeout;
extern const unsigned long kill_timeout;

extern const unsigned long respawn_limit;
extern const unsigned long respawn_window;

// Maximum size of a single plugin protocol line.
extern const size_t frame_limit;

// Maximum nesting of arrays and objects in a JSON document.
extern const size_t json_depth;

// Environment variable with the configuration path.
extern const char config_variable[];

}} // namespace ourd::defaults

#endif
