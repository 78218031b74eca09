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

#ifndef OURD_COMMON_HPP
#define OURD_COMMON_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#define BOOST_FILESYSTEM_VERSION 3
#define BOOST_FILESYSTEM_NO_DEPRECATED

#if !defined(OURD_DEBUG)
    #define BOOST_DISABLE_ASSERTS
#endif

#include <boost/assert.hpp>
#include <boost/version.hpp>

#define OURD_DECLARE_NONCOPYABLE(_name_)        \
    _name_(const _name_& other) = delete;       \
                                                \
    _name_&                                     \
    operator=(const _name_& other) = delete;

#define OURD_VERSION_MAJOR   0
#define OURD_VERSION_MINOR   4
#define OURD_VERSION_RELEASE 0

#include "ourd/errors.hpp"
#include "ourd/forwards.hpp"

#endif
