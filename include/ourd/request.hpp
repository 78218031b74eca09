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

#ifndef OURD_REQUEST_HPP
#define OURD_REQUEST_HPP

#include "ourd/common.hpp"
#include "ourd/dynamic.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/optional/optional.hpp>

#include <system_error>

namespace ourd {

/// Who is making the request, as established by the preprocessor chain.
struct principal_t {
    enum class kind_t {
        none,
        api_key,
        master,
        user
    };

    kind_t kind;
    std::string user_id;

    principal_t():
        kind(kind_t::none)
    { }
};

auto
to_string(principal_t::kind_t kind) -> std::string;

/// Structured per-request error, sent back to the caller as is.
struct failure_t {
    std::error_code code;
    std::string message;
    dynamic_t info;
};

// HTTP header names compare case-insensitively.
struct header_less_t {
    bool
    operator()(const std::string& lhs, const std::string& rhs) const {
        return boost::algorithm::ilexicographical_compare(lhs, rhs);
    }
};

/// Per-request mutable state, threaded through the preprocessor chain into the handler. It is never
/// shared between requests.
class request_t {
public:
    typedef std::map<std::string, std::string, header_less_t> header_map_t;

    // Transport-level attributes, filled by the gateway.
    std::string method;
    std::string path;
    header_map_t headers;
    std::string body;

    // Colon-qualified action name, e.g. "record:save".
    std::string action;
    dynamic_t payload;

    // Captures of the matched path pattern, if any.
    std::vector<std::string> params;

    principal_t principal;

    // Attached by preprocessors.
    std::shared_ptr<api::connection_t> connection;
    std::shared_ptr<api::token_store_t> tokens;
    const hook::registry_t* hooks;

    request_t();

    explicit
    request_t(std::string action, dynamic_t payload = dynamic_t::empty_object);

    auto
    header(const std::string& name) const -> boost::optional<std::string>;

    /// Payload field lookup, null if the payload is not an object or has no such field.
    auto
    field(const std::string& name) const -> const dynamic_t&;

    void
    fail(std::error_code ec, std::string message = std::string(), dynamic_t info = dynamic_t());

    void
    fail(const std::system_error& e);

    auto
    failed() const -> bool {
        return static_cast<bool>(m_failure);
    }

    auto
    failure() const -> const failure_t&;

    void
    respond(dynamic_t result);

    auto
    result() const -> const dynamic_t& {
        return m_result;
    }

private:
    dynamic_t m_result;
    boost::optional<failure_t> m_failure;
};

/// Serializes the failure into the caller-visible error object.
auto
to_dynamic(const failure_t& failure) -> dynamic_t;

} // namespace ourd

#endif
