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

#ifndef OURD_STORAGE_API_HPP
#define OURD_STORAGE_API_HPP

#include "ourd/common.hpp"
#include "ourd/repository.hpp"

#include <map>
#include <mutex>

namespace ourd { namespace api {

// Storage connection, opened for a single request and closed when it is released.

struct connection_t {
    virtual
   ~connection_t() {
        // Empty.
    }

    virtual
    auto
    storage() const -> const std::string& = 0;
};

struct storage_t {
    typedef storage_t category_type;

    virtual
   ~storage_t() {
        // Empty.
    }

    virtual
    std::shared_ptr<connection_t>
    open() = 0;

protected:
    storage_t(context_t&, const std::string& /* name */, const dynamic_t& /* args */) {
        // Empty.
    }
};

typedef std::shared_ptr<storage_t> storage_ptr;

template<>
struct category_traits<storage_t> {
    typedef storage_ptr ptr_type;
    typedef std::function<ptr_type(context_t&, const std::string&, const dynamic_t&)> factory_type;

    static
    const char*
    name() {
        return "storage";
    }

    // Components naming the same storage share one instance for as long as any of them holds it.
    template<class T>
    static
    factory_type
    make() {
        struct cache_t {
            std::mutex mutex;
            std::map<std::string, std::weak_ptr<storage_t>> instances;
        };

        auto cache = std::make_shared<cache_t>();

        return [cache](context_t& context, const std::string& name, const dynamic_t& args) -> ptr_type {
            std::lock_guard<std::mutex> lock(cache->mutex);

            ptr_type instance = cache->instances[name].lock();

            if(instance == nullptr) {
                instance = std::make_shared<T>(context, name, args);
                cache->instances[name] = instance;
            }

            return instance;
        };
    }
};

}} // namespace ourd::api

#endif
