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

#include "ourd/detail/gateway/http.hpp"

#include "ourd/context.hpp"
#include "ourd/defaults.hpp"
#include "ourd/errors.hpp"
#include "ourd/json.hpp"
#include "ourd/logging.hpp"
#include "ourd/router.hpp"

#include <asio/write.hpp>

#include <blackhole/logger.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>

#include <http_parser.h>

#include <array>
#include <cstring>
#include <future>
#include <limits>

namespace ph = std::placeholders;

using namespace ourd;
using namespace ourd::gateway;

using asio::ip::tcp;

auto
ourd::gateway::status_of(const std::error_code& ec) -> int {
    if(ec == error::unknown_action) {
        return 404;
    }

    if(ec == error::malformed_request || ec == error::parse_error) {
        return 400;
    }

    if(ec == error::method_not_allowed) {
        return 405;
    }

    if(ec == error::frame_too_large) {
        return 413;
    }

    if(ec == error::missing_api_key ||
       ec == error::invalid_api_key ||
       ec == error::invalid_access_token ||
       ec == error::access_token_expired ||
       ec == error::user_required)
    {
        return 401;
    }

    if(ec == error::master_key_required) {
        return 403;
    }

    if(ec == error::pool_exhausted ||
       ec == error::plugin_disabled ||
       ec == error::call_timeout ||
       ec == error::pool_shutdown)
    {
        return 503;
    }

    if(ec == error::remote_error) {
        return 400;
    }

    return 500;
}

namespace {

auto
reason(int status) -> const char* {
    switch(status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 503: return "Service Unavailable";
    default:  return "Internal Server Error";
    }
}

} // namespace

// Session

class http_t::session_t:
    public std::enable_shared_from_this<session_t>
{
    http_t& parent;

public:
    tcp::socket socket;

private:
    http_parser parser;
    http_parser_settings settings;

    std::array<char, 4096> chunk;

    std::string method;
    std::string target;
    request_t::header_map_t headers;
    std::string body;

    // Header being assembled, its name and value may arrive in pieces.
    std::string field;
    std::string value;
    bool in_value;

    bool expects_continue;
    bool complete;

    // Set by the parser callbacks to abort parsing.
    std::error_code refusal;
    std::string refusal_reason;

    std::string interim;
    std::string response;

public:
    session_t(http_t& parent_, asio::io_service& loop):
        parent(parent_),
        socket(loop),
        in_value(false),
        expects_continue(false),
        complete(false)
    {
        std::memset(&settings, 0, sizeof(settings));

        settings.on_url = &on_url;
        settings.on_header_field = &on_header_field;
        settings.on_header_value = &on_header_value;
        settings.on_headers_complete = &on_headers_complete;
        settings.on_body = &on_body;
        settings.on_message_complete = &on_message_complete;

        http_parser_init(&parser, HTTP_REQUEST);
        parser.data = this;
    }

    void
    start() {
        read();
    }

    // Runs on a dispatch thread.
    void
    run() {
        const auto result = parent.process(method, target, headers, body);

        socket.get_io_service().post(std::bind(&session_t::write, shared_from_this(), result));
    }

private:
    void
    read() {
        socket.async_read_some(asio::buffer(chunk),
            std::bind(&session_t::on_read, shared_from_this(), ph::_1, ph::_2));
    }

    void
    on_read(const std::error_code& ec, size_t size) {
        if(ec && ec != asio::error::eof) {
            OURD_LOG_DEBUG(parent.m_log, "unable to read request: {}", ec.message());
            return;
        }

        // Zero bytes tell the parser that the peer has finished sending.
        const auto parsed = http_parser_execute(&parser, &settings, chunk.data(), ec ? 0 : size);

        if(refusal) {
            return reject(refusal, refusal_reason);
        }

        if(complete) {
            parent.enter();
            parent.execute(shared_from_this());
            return;
        }

        if(HTTP_PARSER_ERRNO(&parser) != HPE_OK || parsed != (ec ? 0 : size)) {
            return reject(error::malformed_request, format("malformed request - {}",
                http_errno_description(HTTP_PARSER_ERRNO(&parser))));
        }

        if(ec) {
            OURD_LOG_DEBUG(parent.m_log, "connection has been closed before the request was complete");
            return;
        }

        if(expects_continue) {
            expects_continue = false;
            interim = "HTTP/1.1 100 Continue\r\n\r\n";

            asio::async_write(socket, asio::buffer(interim),
                std::bind(&session_t::on_continue, shared_from_this(), ph::_1, ph::_2));
            return;
        }

        read();
    }

    void
    on_continue(const std::error_code& ec, size_t /* size */) {
        if(ec) {
            OURD_LOG_DEBUG(parent.m_log, "unable to write interim response: {}", ec.message());
            return;
        }

        read();
    }

    void
    reject(std::error_code ec, const std::string& text) {
        OURD_LOG_DEBUG(parent.m_log, "rejecting request: {}", text);

        parent.enter();

        write(response_t{status_of(ec), to_dynamic(failure_t{ec, text, dynamic_t()})});
    }

    void
    write(const response_t& result) {
        const auto content = json::serialize(result.body);

        response = format(
            "HTTP/1.1 {} {}\r\n"
            "Content-Type: application/json\r\n"
            "Content-Length: {}\r\n"
            "Connection: close\r\n"
            "\r\n"
            "{}",
            result.status, reason(result.status), content.size(), content
        );

        asio::async_write(socket, asio::buffer(response),
            std::bind(&session_t::on_write, shared_from_this(), ph::_1, ph::_2));
    }

    void
    on_write(const std::error_code& ec, size_t /* size */) {
        if(ec) {
            OURD_LOG_DEBUG(parent.m_log, "unable to write response: {}", ec.message());
        }

        std::error_code ignored;

        socket.shutdown(tcp::socket::shutdown_both, ignored);
        socket.close(ignored);

        parent.leave();
    }

    void
    commit() {
        auto it = headers.find(field);

        if(it == headers.end()) {
            headers[field] = value;
        } else {
            it->second += ", " + value;
        }

        field.clear();
        value.clear();
        in_value = false;
    }

    void
    refuse(std::error_code ec, std::string text) {
        refusal = ec;
        refusal_reason = std::move(text);
    }

    // Parser callbacks

    static
    int
    on_url(http_parser* parser, const char* at, size_t length) {
        static_cast<session_t*>(parser->data)->target.append(at, length);
        return 0;
    }

    static
    int
    on_header_field(http_parser* parser, const char* at, size_t length) {
        auto self = static_cast<session_t*>(parser->data);

        if(self->in_value) {
            self->commit();
        }

        self->field.append(at, length);

        return 0;
    }

    static
    int
    on_header_value(http_parser* parser, const char* at, size_t length) {
        auto self = static_cast<session_t*>(parser->data);

        self->in_value = true;
        self->value.append(at, length);

        return 0;
    }

    static
    int
    on_headers_complete(http_parser* parser) {
        auto self = static_cast<session_t*>(parser->data);

        if(self->in_value) {
            self->commit();
        }

        self->method = http_method_str(static_cast<http_method>(parser->method));

        // The length is all ones when the request has no Content-Length.
        if(parser->content_length != std::numeric_limits<uint64_t>::max() &&
           parser->content_length > defaults::frame_limit)
        {
            self->refuse(error::frame_too_large, format("request body exceeds {} bytes", defaults::frame_limit));
            return -1;
        }

        const auto expect = self->headers.find("Expect");

        if(expect != self->headers.end()) {
            if(!boost::iequals(expect->second, "100-continue")) {
                self->refuse(error::malformed_request, format("expectation '{}' is not supported", expect->second));
                return -1;
            }

            self->expects_continue = true;
        }

        return 0;
    }

    static
    int
    on_body(http_parser* parser, const char* at, size_t length) {
        auto self = static_cast<session_t*>(parser->data);

        // Chunked bodies are only checked as they arrive.
        if(self->body.size() + length > defaults::frame_limit) {
            self->refuse(error::frame_too_large, format("request body exceeds {} bytes", defaults::frame_limit));
            return -1;
        }

        self->body.append(at, length);
        self->expects_continue = false;

        return 0;
    }

    static
    int
    on_message_complete(http_parser* parser) {
        auto self = static_cast<session_t*>(parser->data);

        self->complete = true;
        self->expects_continue = false;

        // Anything after the first request is ignored.
        http_parser_pause(parser, 1);

        return 0;
    }
};

// Gateway

http_t::http_t(context_t& context, const router_t& router, const config_t::http_t& config):
    m_log(context.log("gateway/http")),
    m_router(router),
    m_loop(std::make_shared<asio::io_service>()),
    m_acceptor(*m_loop),
    m_pool_size(config.pool),
    m_inflight(0),
    m_workers(0)
{
    const tcp::endpoint endpoint(asio::ip::address::from_string(config.endpoint), config.port);

    m_acceptor.open(endpoint.protocol());
    m_acceptor.set_option(tcp::acceptor::reuse_address(true));
    m_acceptor.bind(endpoint);
    m_acceptor.listen();

    OURD_LOG_INFO(m_log, "listening on {}:{}", endpoint.address().to_string(), endpoint.port());
}

http_t::~http_t() {
    stop(std::chrono::milliseconds(0));
    join();
}

void
http_t::start() {
    m_work.reset(new asio::io_service::work(*m_loop));

    accept();

    for(size_t i = 0; i < m_pool_size; ++i) {
        m_pool.create_thread([this] { m_loop->run(); });
    }

    OURD_LOG_INFO(m_log, "started {} I/O thread(s)", m_pool_size);
}

void
http_t::stop(std::chrono::milliseconds drain) {
    if(!m_work) {
        return;
    }

    std::promise<void> closed;

    m_loop->post([&] {
        std::error_code ignored;
        m_acceptor.close(ignored);
        closed.set_value();
    });

    closed.get_future().wait();

    {
        std::unique_lock<std::mutex> lock(m_mutex);

        if(!m_drained.wait_for(lock, drain, [this] { return m_inflight == 0; })) {
            OURD_LOG_WARNING(m_log, "{} request(s) are still in flight after {} ms", m_inflight, drain.count());
        }
    }

    m_work.reset();
    m_loop->stop();
    m_pool.join_all();

    OURD_LOG_INFO(m_log, "gateway has been stopped");
}

void
http_t::join() {
    std::unique_lock<std::mutex> lock(m_mutex);

    if(m_workers != 0) {
        OURD_LOG_INFO(m_log, "waiting for {} dispatch thread(s) to finish", m_workers);
    }

    m_idle.wait(lock, [this] { return m_workers == 0; });
}

auto
http_t::endpoint() const -> tcp::endpoint {
    return m_acceptor.local_endpoint();
}

auto
http_t::process(const std::string& method,
                const std::string& target,
                const request_t::header_map_t& headers,
                const std::string& body) const -> response_t
{
    request_t request;

    std::string path = target.substr(0, target.find('?'));

    if(!path.empty() && path[0] == '/') {
        path.erase(0, 1);
    }

    request.method  = method;
    request.path    = path;
    request.headers = headers;
    request.body    = body;

    OURD_LOG_DEBUG(m_log, "processing {} {} with {} byte(s) of body", method, target, body.size());

    if(!m_router.dispatch(method, path, request)) {
        if(method != "POST") {
            request.fail(error::method_not_allowed, format("method {} is not allowed", method));
        } else {
            dynamic_t payload = dynamic_t::empty_object;

            try {
                if(!body.empty()) {
                    payload = json::parse(body);
                }
            } catch(const std::system_error& e) {
                request.fail(error::malformed_request, format("request body is not a valid JSON - {}", e.what()));
            }

            if(!request.failed() && !payload.is_object()) {
                request.fail(error::malformed_request, "request body must be a JSON object");
            }

            if(!request.failed()) {
                const auto& action = payload.as_object().at("action", dynamic_t::null);

                if(action.is_string()) {
                    request.action = action.as_string();
                } else if(action.is_null()) {
                    request.action = boost::replace_all_copy(path, "/", ":");
                } else {
                    request.fail(error::malformed_request, "\"action\" must be a string");
                }
            }

            if(!request.failed()) {
                request.payload = std::move(payload);
                m_router.dispatch(request);
            }
        }
    }

    response_t response;

    if(request.failed()) {
        response.status = status_of(request.failure().code);
        response.body   = to_dynamic(request.failure());
    } else {
        response.status = 200;
        response.body   = dynamic_t::object_t{{"result", request.result()}};
    }

    OURD_LOG_DEBUG(m_log, "responding to {} {} with {}", method, target, response.status);

    return response;
}

void
http_t::accept() {
    auto session = std::make_shared<session_t>(*this, *m_loop);

    m_acceptor.async_accept(session->socket,
        std::bind(&http_t::on_accept, this, session, ph::_1));
}

void
http_t::on_accept(const std::shared_ptr<session_t>& session, const std::error_code& ec) {
    if(ec == asio::error::operation_aborted) {
        return;
    }

    if(ec) {
        OURD_LOG_WARNING(m_log, "unable to accept connection: {}", ec.message());
    } else {
        session->start();
    }

    if(m_acceptor.is_open()) {
        accept();
    }
}

void
http_t::execute(const std::shared_ptr<session_t>& session) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_workers;
    }

    boost::thread worker([this, session]() mutable {
        session->run();

        // The session must not outlive the gateway, which may be gone once the count drops.
        session.reset();

        std::lock_guard<std::mutex> lock(m_mutex);

        if(--m_workers == 0) {
            m_idle.notify_all();
        }
    }, session);

    worker.detach();
}

void
http_t::enter() {
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_inflight;
}

void
http_t::leave() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if(--m_inflight == 0) {
        m_drained.notify_all();
    }
}
