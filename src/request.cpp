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

#include "ourd/request.hpp"

#include "ourd/errors.hpp"

using namespace ourd;

auto
ourd::to_string(principal_t::kind_t kind) -> std::string {
    switch(kind) {
    case principal_t::kind_t::api_key:
        return "api-key";
    case principal_t::kind_t::master:
        return "master";
    case principal_t::kind_t::user:
        return "user";
    default:
        return "none";
    }
}

request_t::request_t():
    payload(dynamic_t::empty_object),
    hooks(nullptr)
{ }

request_t::request_t(std::string action_, dynamic_t payload_):
    action(std::move(action_)),
    payload(std::move(payload_)),
    hooks(nullptr)
{ }

auto
request_t::header(const std::string& name) const -> boost::optional<std::string> {
    auto it = headers.find(name);

    if(it == headers.end()) {
        return boost::none;
    }

    return it->second;
}

auto
request_t::field(const std::string& name) const -> const dynamic_t& {
    if(!payload.is_object()) {
        return dynamic_t::null;
    }

    return payload.as_object().at(name, dynamic_t::null);
}

void
request_t::fail(std::error_code ec, std::string message, dynamic_t info) {
    if(message.empty()) {
        message = ec.message();
    }

    m_failure = failure_t{std::move(ec), std::move(message), std::move(info)};
}

void
request_t::fail(const std::system_error& e) {
    fail(e.code(), e.what());
}

auto
request_t::failure() const -> const failure_t& {
    if(!m_failure) {
        throw error_t("request has not failed");
    }

    return *m_failure;
}

void
request_t::respond(dynamic_t result) {
    m_result = std::move(result);
}

auto
ourd::to_dynamic(const failure_t& failure) -> dynamic_t {
    dynamic_t::object_t error = {
        {"type",    failure.code.category().name()},
        {"code",    failure.code.value()},
        {"message", failure.message}
    };

    const auto name = error::name(failure.code);

    if(!name.empty()) {
        error["name"] = name;
    }

    if(!failure.info.is_null()) {
        error["info"] = failure.info;
    }

    return dynamic_t::object_t{{"error", error}};
}
