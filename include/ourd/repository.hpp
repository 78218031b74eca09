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


#ifndef OURD_REPOSITORY_HPP
#define OURD_REPOSITORY_HPP

#include "ourd/common.hpp"
#include "ourd/errors.hpp"

#include <boost/any.hpp>

#include <functional>
#include <map>
#include <type_traits>

namespace ourd { namespace api {

// Every component category specializes this with:
//
//   ptr_type         what its factories produce;
//   factory_type     a std::function producing ptr_type;
//   name()           the category name used in diagnostics;
//   make<T>()        the factory for the component class T.
template<class Category>
struct category_traits;

/// Named component factories, grouped by category. Builtin storages, token stores and plugin
/// transports are registered here on startup and looked up by the type name given in the
/// configuration.
class repository_t {
    OURD_DECLARE_NONCOPYABLE(repository_t)

    const std::unique_ptr<logging::logger_t> m_log;

    // Category name to component name to its factory, which is a category_traits<>::factory_type.
    std::map<std::string, std::map<std::string, boost::any>> m_factories;

public:
    explicit
    repository_t(std::unique_ptr<logging::logger_t> log);

   ~repository_t();

    /// \throws std::system_error with error::component_not_found.
    template<class Category, class... Args>
    auto
    get(const std::string& name, Args&&... args) const -> typename category_traits<Category>::ptr_type;

    template<class Category>
    auto
    contains(const std::string& name) const -> bool {
        return find(category_traits<Category>::name(), name) != nullptr;
    }

    /// Component names registered in the category.
    template<class Category>
    auto
    types() const -> std::vector<std::string> {
        return types(category_traits<Category>::name());
    }

    /// \throws std::system_error with error::duplicate_component.
    template<class T>
    void
    insert(const std::string& name);

private:
    auto
    find(const std::string& category, const std::string& name) const -> const boost::any*;

    auto
    types(const std::string& category) const -> std::vector<std::string>;

    void
    insert(const std::string& category, const std::string& name, boost::any factory);
};

template<class Category, class... Args>
auto
repository_t::get(const std::string& name, Args&&... args) const -> typename category_traits<Category>::ptr_type {
    typedef category_traits<Category> traits_type;

    const auto factory = find(traits_type::name(), name);

    if(factory == nullptr) {
        throw error_t(error::component_not_found, "{} '{}' is not available", traits_type::name(), name);
    }

    return boost::any_cast<const typename traits_type::factory_type&>(*factory)(std::forward<Args>(args)...);
}

template<class T>
void
repository_t::insert(const std::string& name) {
    typedef typename T::category_type category_type;
    typedef category_traits<category_type> traits_type;

    static_assert(
        std::is_base_of<category_type, T>::value,
        "component is not derived from its category"
    );

    const typename traits_type::factory_type factory = traits_type::template make<T>();

    insert(traits_type::name(), name, factory);
}

}} // namespace ourd::api

#endif
