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

#ifndef OURD_JSON_HPP
#define OURD_JSON_HPP

#include "ourd/dynamic.hpp"

#include <string>

namespace ourd { namespace json {

enum class mode_t {
    strict,
    // Allows comments and trailing commas, which is handy for hand-written configuration files.
    relaxed
};

/// Parses a JSON document into a dynamic value.
///
/// \throws std::system_error with error::parse_error if the document is malformed.
dynamic_t
parse(const std::string& source, mode_t mode = mode_t::strict);

std::string
serialize(const dynamic_t& value);

}} // namespace ourd::json

#endif
