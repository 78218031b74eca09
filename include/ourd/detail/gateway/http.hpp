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

#ifndef OURD_GATEWAY_HTTP_HPP
#define OURD_GATEWAY_HTTP_HPP

#include "ourd/common.hpp"
#include "ourd/context/config.hpp"
#include "ourd/request.hpp"

#include <asio/io_service.hpp>
#include <asio/ip/tcp.hpp>

#include <boost/thread/thread.hpp>

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ourd { namespace gateway {

struct response_t {
    int status;
    dynamic_t body;
};

/// HTTP status for a request failure.
auto
status_of(const std::error_code& ec) -> int;

/// HTTP/1.1 listener. Every connection carries a single request with a JSON body and is closed
/// after the response. Bodies may be sent with a length or chunked, and clients expecting a
/// "100 Continue" interim response get one once the head has been accepted.
///
/// Sockets are served by a fixed pool of I/O threads, while every parsed request is dispatched on
/// a worker thread of its own, so slow handlers never stall the I/O.
///
/// A request whose method and path match a pattern route is dispatched by it. Any other request
/// must be a POST with a JSON object body, its "action" field names the action. Without the field
/// the action is derived from the path, "record/save" being "record:save".
class http_t {
    OURD_DECLARE_NONCOPYABLE(http_t)

    class session_t;

    const std::unique_ptr<logging::logger_t> m_log;
    const router_t& m_router;

    const std::shared_ptr<asio::io_service> m_loop;

    asio::ip::tcp::acceptor m_acceptor;
    std::unique_ptr<asio::io_service::work> m_work;

    boost::thread_group m_pool;
    const size_t m_pool_size;

    std::mutex m_mutex;
    std::condition_variable m_drained;
    std::condition_variable m_idle;

    // Requests between the end of parsing and the end of the response write.
    size_t m_inflight;

    // Running dispatch threads.
    size_t m_workers;

public:
    http_t(context_t& context, const router_t& router, const config_t::http_t& config);
   ~http_t();

    void
    start();

    /// Stops accepting, waits up to the timeout for the requests in flight and shuts the I/O down.
    /// Responses of the requests which are still running after that are dropped.
    void
    stop(std::chrono::milliseconds drain);

    /// Waits for the dispatch threads to finish, however long they take.
    void
    join();

    auto
    endpoint() const -> asio::ip::tcp::endpoint;

    /// Processes one request synchronously.
    auto
    process(const std::string& method,
            const std::string& target,
            const request_t::header_map_t& headers,
            const std::string& body) const -> response_t;

private:
    void
    accept();

    void
    on_accept(const std::shared_ptr<session_t>& session, const std::error_code& ec);

    void
    execute(const std::shared_ptr<session_t>& session);

    void
    enter();

    void
    leave();
};

}} // namespace ourd::gateway

#endif
