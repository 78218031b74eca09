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

#ifndef OURD_SPLITTER_HPP
#define OURD_SPLITTER_HPP

#include <string>

#include <boost/optional.hpp>

namespace ourd { namespace detail {

// Accumulates stream chunks and cuts them into newline-terminated lines.

class splitter_t {
    std::string unparsed;

public:
    void
    consume(const char* data, size_t size) {
        unparsed.append(data, size);
    }

    boost::optional<std::string>
    next() {
        auto pos = unparsed.find('\n');
        if(pos == std::string::npos) {
            return boost::none;
        }

        auto line = unparsed.substr(0, pos);
        unparsed.erase(0, pos + 1);

        if(!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        return boost::make_optional(line);
    }

    // Size of the incomplete trailing line.
    size_t
    pending() const {
        return unparsed.size();
    }
};

}} // namespace ourd::detail

#endif
