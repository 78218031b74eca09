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

#include "ourd/detail/transport/exec.hpp"

#include "ourd/context.hpp"
#include "ourd/defaults.hpp"
#include "ourd/detail/isolate/process.hpp"
#include "ourd/detail/splitter.hpp"
#include "ourd/errors.hpp"
#include "ourd/logging.hpp"
#include "ourd/plugin/descriptor.hpp"

#include <asio/io_service.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/write.hpp>

#include <blackhole/attribute.hpp>
#include <blackhole/logger.hpp>

#include <array>
#include <csignal>
#include <future>
#include <mutex>

namespace ph = std::placeholders;

using namespace ourd;
using namespace ourd::transport;

using plugin::protocol::reply_t;

// Session with one plugin process. The stream descriptors are only touched from the event loop
// thread, while calls are submitted from request threads.

class exec_t::session_t:
    public std::enable_shared_from_this<session_t>
{
public:
    const std::unique_ptr<logging::logger_t> log;

private:
    asio::io_service& loop;

    std::unique_ptr<isolate::process_t> process;

    asio::posix::stream_descriptor input;
    asio::posix::stream_descriptor output;
    asio::posix::stream_descriptor errors;

    std::array<char, 4096> output_buffer;
    std::array<char, 4096> errors_buffer;

    detail::splitter_t output_splitter;
    detail::splitter_t errors_splitter;

    // Message being written, kept alive until the write completes.
    std::string outgoing;

    bool terminated;

    struct pending_t {
        uint64_t id;
        std::promise<reply_t> promise;
    };

    mutable std::mutex mutex;

    std::shared_ptr<pending_t> pending;
    uint64_t counter;
    bool dead;

public:
    session_t(std::unique_ptr<isolate::process_t> process_,
              std::unique_ptr<logging::logger_t> log_,
              asio::io_service& loop_):
        log(std::move(log_)),
        loop(loop_),
        process(std::move(process_)),
        input(loop, process->input()),
        output(loop, process->output()),
        errors(loop, process->errors()),
        terminated(false),
        counter(0),
        dead(false)
    { }

    void
    start() {
        loop.post(std::bind(&session_t::read_output, shared_from_this()));
        loop.post(std::bind(&session_t::read_errors, shared_from_this()));
    }

    auto
    send(const std::string& kind, const std::string& name, const dynamic_t& context) -> std::future<reply_t> {
        std::lock_guard<std::mutex> lock(mutex);

        if(dead) {
            throw error_t(error::process_exited, "plugin process is no longer available");
        }

        if(pending) {
            throw error_t(error::protocol_violation, "plugin process is already serving a call");
        }

        auto call = std::make_shared<pending_t>();

        call->id = counter++;

        auto line = plugin::protocol::encode(call->id, kind, name, context);
        auto future = call->promise.get_future();

        OURD_LOG_DEBUG(log, "sending '{}' message '{}' with id {}", kind, name, call->id);

        pending = call;

        loop.post(std::bind(&session_t::write, shared_from_this(), std::move(line)));

        return future;
    }

    auto
    alive() const -> bool {
        std::lock_guard<std::mutex> lock(mutex);
        return !dead;
    }

    void
    fail(std::error_code ec, const std::string& message) {
        if(abort(ec, message)) {
            OURD_LOG_WARNING(log, "plugin session has failed: {}", message);
        }
    }

    void
    stop() {
        if(abort(error::process_exited, "plugin process has been terminated")) {
            OURD_LOG_DEBUG(log, "terminating plugin session");
        }
    }

private:
    // Marks the session dead, fails the pending call and schedules the process termination.
    auto
    abort(std::error_code ec, const std::string& message) -> bool {
        std::shared_ptr<pending_t> call;

        {
            std::lock_guard<std::mutex> lock(mutex);

            if(dead) {
                return false;
            }

            dead = true;
            call = std::move(pending);
            pending.reset();
        }

        if(call) {
            call->promise.set_exception(std::make_exception_ptr(error_t(ec, "{}", message)));
        }

        loop.post(std::bind(&session_t::shutdown, shared_from_this()));

        return true;
    }

    void
    shutdown() {
        if(terminated) {
            return;
        }

        terminated = true;

        std::error_code ignored;

        input.close(ignored);
        output.close(ignored);

        // The error stream is left open until the process closes it, so that its last words are
        // still logged.
        process->terminate();
    }

    void
    write(const std::string& line) {
        if(terminated) {
            return;
        }

        outgoing = line;

        asio::async_write(input, asio::buffer(outgoing),
            std::bind(&session_t::on_write, shared_from_this(), ph::_1, ph::_2));
    }

    void
    on_write(const std::error_code& ec, size_t /* length */) {
        if(ec && ec != asio::error::operation_aborted) {
            fail(error::process_exited, format("unable to write to plugin process - {}", ec.message()));
        }
    }

    void
    read_output() {
        output.async_read_some(asio::buffer(output_buffer.data(), output_buffer.size()),
            std::bind(&session_t::on_output, shared_from_this(), ph::_1, ph::_2));
    }

    void
    on_output(const std::error_code& ec, size_t length) {
        if(ec == asio::error::operation_aborted) {
            return;
        }

        if(ec) {
            fail(error::process_exited, ec == asio::error::eof ?
                "plugin process has closed its output" :
                format("unable to read from plugin process - {}", ec.message()));
            return;
        }

        output_splitter.consume(output_buffer.data(), length);

        while(auto line = output_splitter.next()) {
            if(line->empty()) {
                continue;
            }

            if(!process_line(*line)) {
                return;
            }
        }

        if(output_splitter.pending() > defaults::frame_limit) {
            fail(error::protocol_violation, format("plugin reply exceeds {} bytes", defaults::frame_limit));
            return;
        }

        read_output();
    }

    auto
    process_line(const std::string& line) -> bool {
        reply_t reply;

        try {
            reply = plugin::protocol::decode(line);
        } catch(const std::system_error& e) {
            fail(e.code(), e.what());
            return false;
        }

        std::shared_ptr<pending_t> call;

        {
            std::lock_guard<std::mutex> lock(mutex);

            if(pending && pending->id == reply.id) {
                call = std::move(pending);
                pending.reset();
            }
        }

        if(!call) {
            fail(error::protocol_violation, format("unexpected plugin reply with id {}", reply.id));
            return false;
        }

        OURD_LOG_DEBUG(log, "received '{}' reply with id {}", reply.kind, reply.id);

        call->promise.set_value(std::move(reply));

        return true;
    }

    void
    read_errors() {
        errors.async_read_some(asio::buffer(errors_buffer.data(), errors_buffer.size()),
            std::bind(&session_t::on_errors, shared_from_this(), ph::_1, ph::_2));
    }

    void
    on_errors(const std::error_code& ec, size_t length) {
        if(ec == asio::error::operation_aborted) {
            return;
        }

        if(ec == asio::error::eof) {
            // Plugins may close it and keep running, only the output stream tells about an exit.
            OURD_LOG_DEBUG(log, "plugin process has closed its error stream");
            return;
        }

        if(ec) {
            OURD_LOG_WARNING(log, "unable to read plugin error stream: {}", ec.message());
            return;
        }

        errors_splitter.consume(errors_buffer.data(), length);

        while(auto line = errors_splitter.next()) {
            OURD_LOG_DEBUG(log, "stderr: {}", *line);
        }

        read_errors();
    }
};

// Exec transport

exec_t::exec_t(context_t& context, asio::io_service& loop, const plugin::descriptor_t& descriptor):
    m_log(context.log(format("plugin/{}", descriptor.name))),
    m_name(descriptor.name)
{
    static std::once_flag sigpipe;

    // Writes into a pipe of an exited plugin must fail with EPIPE instead.
    std::call_once(sigpipe, [] { ::signal(SIGPIPE, SIG_IGN); });

    auto process = isolate::spawn(descriptor.path, descriptor.argv, descriptor.timeout.kill,
        context.log(format("plugin/{}/process", descriptor.name)), loop);

    m_pid = process->pid();

    OURD_LOG_INFO(m_log, "spawned plugin instance with pid {}", m_pid);

    m_session = std::make_shared<session_t>(
        std::move(process),
        context.log(format("plugin/{}", descriptor.name), {{"pid", blackhole::attribute::value_t(m_pid)}}),
        loop
    );

    m_session->start();
}

exec_t::~exec_t() {
    terminate();
}

reply_t
exec_t::call(const std::string& kind,
             const std::string& name,
             const dynamic_t& context,
             std::chrono::milliseconds timeout)
{
    auto future = m_session->send(kind, name, context);

    if(future.wait_for(timeout) != std::future_status::ready) {
        const auto message = format("plugin has not replied to '{}' within {} ms", name, timeout.count());

        m_session->fail(error::call_timeout, message);

        throw error_t(error::call_timeout, "{}", message);
    }

    return future.get();
}

bool
exec_t::alive() const {
    return m_session->alive();
}

void
exec_t::terminate() {
    m_session->stop();
}

std::string
exec_t::id() const {
    return format("pid {}", m_pid);
}
