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

#ifndef OURD_DETAIL_LOOP_HPP
#define OURD_DETAIL_LOOP_HPP

#include "ourd/common.hpp"

#include <asio/io_service.hpp>

#include <boost/thread/thread.hpp>

namespace ourd { namespace io {

/// Event loop serviced by a dedicated thread, which carries the given name for diagnostics.
///
/// Destruction waits for every handler posted so far, including the armed timers.
class loop_t {
    OURD_DECLARE_NONCOPYABLE(loop_t)

    asio::io_service m_service;
    std::unique_ptr<asio::io_service::work> m_work;
    boost::thread m_thread;

public:
    explicit
    loop_t(const std::string& name);

   ~loop_t();

    auto
    service() -> asio::io_service& {
        return m_service;
    }
};

}} // namespace ourd::io

#endif
