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

#ifndef OURD_DYNAMIC_HPP
#define OURD_DYNAMIC_HPP

#include "ourd/errors.hpp"

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/variant.hpp>

namespace ourd {

/// Schemaless value: request payloads, plugin messages and configuration sections are all
/// represented by it.
class dynamic_t {
public:
    typedef bool                   bool_t;
    typedef int64_t                int_t;
    typedef uint64_t               uint_t;
    typedef double                 double_t;
    typedef std::string            string_t;
    typedef std::vector<dynamic_t> array_t;

    struct null_t {
        bool
        operator==(const null_t&) const {
            return true;
        }
    };

    class object_t;

    typedef boost::variant<
        null_t,
        bool_t,
        int_t,
        uint_t,
        double_t,
        string_t,
        boost::recursive_wrapper<array_t>,
        boost::recursive_wrapper<object_t>
    > value_t;

    // Just useful constants which may be accessed by reference from any place of the program.
    static const dynamic_t null;
    static const dynamic_t empty_string;
    static const dynamic_t empty_array;
    static const dynamic_t empty_object;

public:
    dynamic_t();
    dynamic_t(const dynamic_t& other);
    dynamic_t(dynamic_t&& other);

    dynamic_t(null_t);
    dynamic_t(bool_t value);
    dynamic_t(double_t value);
    dynamic_t(const char* value);
    dynamic_t(string_t value);
    dynamic_t(array_t value);
    dynamic_t(object_t value);

    template<class T>
    dynamic_t(T value,
              typename std::enable_if<std::is_integral<T>::value && std::is_signed<T>::value>::type* = 0):
        m_value(int_t(value))
    {}

    template<class T>
    dynamic_t(T value,
              typename std::enable_if<std::is_integral<T>::value && std::is_unsigned<T>::value &&
                                      !std::is_same<T, bool>::value>::type* = 0):
        m_value(uint_t(value))
    {}

    dynamic_t&
    operator=(const dynamic_t& other);

    dynamic_t&
    operator=(dynamic_t&& other);

    bool
    operator==(const dynamic_t& other) const;

    bool
    operator!=(const dynamic_t& other) const;

    template<class Visitor>
    typename Visitor::result_type
    apply(Visitor& visitor) const {
        return boost::apply_visitor(visitor, m_value);
    }

    bool
    is_null() const;

    bool
    is_bool() const;

    bool
    is_int() const;

    bool
    is_uint() const;

    bool
    is_double() const;

    bool
    is_string() const;

    bool
    is_array() const;

    bool
    is_object() const;

    bool_t
    as_bool() const;

    /// Integral accessors convert between signed and unsigned representations as long as the value
    /// fits, because the parser stores every non-negative integer as an unsigned one.
    int_t
    as_int() const;

    uint_t
    as_uint() const;

    double_t
    as_double() const;

    const string_t&
    as_string() const;

    const array_t&
    as_array() const;

    const object_t&
    as_object() const;

    string_t&
    as_string();

    array_t&
    as_array();

    object_t&
    as_object();

private:
    template<class T>
    T&
    get();

    template<class T>
    const T&
    get() const {
        return const_cast<dynamic_t*>(this)->get<T>();
    }

    template<class T>
    bool
    is() const {
        return boost::get<T>(&m_value) != nullptr;
    }

private:
    value_t m_value;
};

class dynamic_t::object_t:
    public std::map<std::string, dynamic_t>
{
    typedef std::map<std::string, dynamic_t> base_type;

public:
    object_t() {}

    object_t(const base_type& other): base_type(other) {}
    object_t(base_type&& other): base_type(std::move(other)) {}

    object_t(std::initializer_list<value_type> list): base_type(list) {}

    using base_type::at;

    /// Returns the value under the key, or the given default if there is no such key.
    const dynamic_t&
    at(const std::string& key, const dynamic_t& default_) const;

    bool
    operator==(const object_t& other) const {
        return static_cast<const base_type&>(*this) == static_cast<const base_type&>(other);
    }
};

std::ostream&
operator<<(std::ostream& stream, const dynamic_t& value);

} // namespace ourd

#endif
