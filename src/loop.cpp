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

#include "ourd/detail/loop.hpp"

#include <pthread.h>

using namespace ourd::io;

namespace {

void
rename_current_thread(const std::string& name) {
#if defined(__linux__)
    // The kernel keeps 15 characters at most.
    ::pthread_setname_np(::pthread_self(), name.substr(0, 15).c_str());
#elif defined(__APPLE__)
    ::pthread_setname_np(name.c_str());
#endif
}

} // namespace

loop_t::loop_t(const std::string& name):
    m_work(new asio::io_service::work(m_service)),
    m_thread([this, name] {
        rename_current_thread(name);
        m_service.run();
    })
{ }

loop_t::~loop_t() {
    m_work.reset();
    m_thread.join();
}
