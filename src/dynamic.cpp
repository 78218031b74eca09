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

#include "ourd/dynamic.hpp"

#include "ourd/json.hpp"
#include "ourd/logging.hpp"

#include <limits>
#include <ostream>

using namespace ourd;

const dynamic_t dynamic_t::null = dynamic_t::null_t();
const dynamic_t dynamic_t::empty_string = dynamic_t::string_t();
const dynamic_t dynamic_t::empty_array = dynamic_t::array_t();
const dynamic_t dynamic_t::empty_object = dynamic_t::object_t();

namespace {

struct type_name_visitor:
    public boost::static_visitor<const char*>
{
    const char* operator()(const dynamic_t::null_t&) const { return "null"; }
    const char* operator()(const dynamic_t::bool_t&) const { return "bool"; }
    const char* operator()(const dynamic_t::int_t&) const { return "int"; }
    const char* operator()(const dynamic_t::uint_t&) const { return "uint"; }
    const char* operator()(const dynamic_t::double_t&) const { return "double"; }
    const char* operator()(const dynamic_t::string_t&) const { return "string"; }
    const char* operator()(const dynamic_t::array_t&) const { return "array"; }
    const char* operator()(const dynamic_t::object_t&) const { return "object"; }
};

} // namespace

template<class T>
T&
dynamic_t::get() {
    if(T* ptr = boost::get<T>(&m_value)) {
        return *ptr;
    }

    type_name_visitor visitor;

    throw error_t("failed to get node value as {} - got {}",
        logging::demangle<T>(), boost::apply_visitor(visitor, m_value));
}

dynamic_t::dynamic_t():
    m_value(null_t())
{}

dynamic_t::dynamic_t(const dynamic_t& other):
    m_value(other.m_value)
{}

dynamic_t::dynamic_t(dynamic_t&& other):
    m_value(null_t())
{
    m_value.swap(other.m_value);
}

dynamic_t::dynamic_t(null_t):
    m_value(null_t())
{}

dynamic_t::dynamic_t(bool_t value):
    m_value(value)
{}

dynamic_t::dynamic_t(double_t value):
    m_value(value)
{}

dynamic_t::dynamic_t(const char* value):
    m_value(string_t(value))
{}

dynamic_t::dynamic_t(string_t value):
    m_value(std::move(value))
{}

dynamic_t::dynamic_t(array_t value):
    m_value(std::move(value))
{}

dynamic_t::dynamic_t(object_t value):
    m_value(std::move(value))
{}

dynamic_t&
dynamic_t::operator=(const dynamic_t& other) {
    m_value = other.m_value;
    return *this;
}

dynamic_t&
dynamic_t::operator=(dynamic_t&& other) {
    m_value.swap(other.m_value);
    return *this;
}

bool
dynamic_t::operator==(const dynamic_t& other) const {
    // Integers coming from the parser are unsigned whenever they are non-negative, so numeric
    // comparison must not depend on the representation.
    if((is_int() || is_uint()) && (other.is_int() || other.is_uint())) {
        if(is_int() && as_int() < 0) {
            return other.is_int() && other.as_int() == as_int();
        }

        if(other.is_int() && other.as_int() < 0) {
            return false;
        }

        return as_uint() == other.as_uint();
    }

    return m_value == other.m_value;
}

bool
dynamic_t::operator!=(const dynamic_t& other) const {
    return !operator==(other);
}

bool
dynamic_t::is_null() const {
    return is<null_t>();
}

bool
dynamic_t::is_bool() const {
    return is<bool_t>();
}

bool
dynamic_t::is_int() const {
    return is<int_t>();
}

bool
dynamic_t::is_uint() const {
    return is<uint_t>();
}

bool
dynamic_t::is_double() const {
    return is<double_t>();
}

bool
dynamic_t::is_string() const {
    return is<string_t>();
}

bool
dynamic_t::is_array() const {
    return is<array_t>();
}

bool
dynamic_t::is_object() const {
    return is<object_t>();
}

dynamic_t::bool_t
dynamic_t::as_bool() const {
    return get<bool_t>();
}

dynamic_t::int_t
dynamic_t::as_int() const {
    if(is_uint()) {
        const auto value = get<uint_t>();

        if(value > static_cast<uint_t>(std::numeric_limits<int_t>::max())) {
            throw error_t("value {} is out of the signed integer range", value);
        }

        return static_cast<int_t>(value);
    }

    return get<int_t>();
}

dynamic_t::uint_t
dynamic_t::as_uint() const {
    if(is_int()) {
        const auto value = get<int_t>();

        if(value < 0) {
            throw error_t("value {} is out of the unsigned integer range", value);
        }

        return static_cast<uint_t>(value);
    }

    return get<uint_t>();
}

dynamic_t::double_t
dynamic_t::as_double() const {
    if(is_int()) {
        return static_cast<double_t>(get<int_t>());
    } else if(is_uint()) {
        return static_cast<double_t>(get<uint_t>());
    }

    return get<double_t>();
}

const dynamic_t::string_t&
dynamic_t::as_string() const {
    return get<string_t>();
}

const dynamic_t::array_t&
dynamic_t::as_array() const {
    return get<array_t>();
}

const dynamic_t::object_t&
dynamic_t::as_object() const {
    return get<object_t>();
}

dynamic_t::string_t&
dynamic_t::as_string() {
    return get<string_t>();
}

dynamic_t::array_t&
dynamic_t::as_array() {
    return get<array_t>();
}

dynamic_t::object_t&
dynamic_t::as_object() {
    return get<object_t>();
}

const dynamic_t&
dynamic_t::object_t::at(const std::string& key, const dynamic_t& default_) const {
    auto it = find(key);

    if(it == end()) {
        return default_;
    }

    return it->second;
}

std::ostream&
ourd::operator<<(std::ostream& stream, const dynamic_t& value) {
    return stream << json::serialize(value);
}
