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


#include "ourd/detail/token_store/files.hpp"

#include "ourd/context.hpp"
#include "ourd/errors.hpp"
#include "ourd/json.hpp"
#include "ourd/logging.hpp"

#include <blackhole/logger.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <cctype>
#include <iterator>

using namespace ourd;
using namespace ourd::token_store;

namespace fs = boost::filesystem;
namespace bpt = boost::posix_time;

namespace {

auto
valid(const std::string& access_token) -> bool {
    if(access_token.empty()) {
        return false;
    }

    for(auto it = access_token.begin(); it != access_token.end(); ++it) {
        if(!std::isalnum(static_cast<unsigned char>(*it)) && *it != '-' && *it != '_') {
            return false;
        }
    }

    return true;
}

auto
encode(const api::token_t& token) -> dynamic_t {
    dynamic_t expired_at;

    if(!token.expired_at.is_not_a_date_time()) {
        expired_at = bpt::to_iso_extended_string(token.expired_at);
    }

    return dynamic_t::object_t{
        {"access_token", token.access_token},
        {"user_id",      token.user_id     },
        {"expired_at",   expired_at        }
    };
}

// Throws on a record which is not a token.
auto
decode(const dynamic_t& record) -> api::token_t {
    if(!record.is_object()) {
        throw error_t("token record must be an object");
    }

    const auto& object = record.as_object();

    const dynamic_t access_token = object.at("access_token", dynamic_t());
    const dynamic_t user_id = object.at("user_id", dynamic_t());
    const dynamic_t expired_at = object.at("expired_at", dynamic_t());

    if(!access_token.is_string() || !user_id.is_string()) {
        throw error_t("token record must have \"access_token\" and \"user_id\" strings");
    }

    api::token_t token;

    token.access_token = access_token.as_string();
    token.user_id = user_id.as_string();

    if(expired_at.is_string()) {
        try {
            token.expired_at = boost::date_time::parse_delimited_time<bpt::ptime>(expired_at.as_string(), 'T');
        } catch(const std::exception& e) {
            throw error_t("token expiry time '{}' is malformed - {}", expired_at.as_string(), e.what());
        }
    } else if(!expired_at.is_null()) {
        throw error_t("token expiry time must be a string");
    }

    return token;
}

} // namespace

files_t::files_t(context_t& context, const std::string& name, const dynamic_t& args):
    category_type(context, name, args),
    m_log(context.log(format("token_store/{}", name))),
    m_path(args.is_object() && args.as_object().at("path", dynamic_t()).is_string() ?
        args.as_object().at("path", dynamic_t()).as_string() : std::string())
{
    if(m_path.empty()) {
        throw error_t("token store '{}' requires a \"path\" argument", name);
    }

    boost::system::error_code ec;

    fs::create_directories(m_path, ec);

    if(ec) {
        throw error_t("unable to create token directory '{}' - {}", m_path.string(), ec.message());
    }

    OURD_LOG_INFO(m_log, "keeping access tokens in '{}'", m_path.string());
}

auto
files_t::get(const std::string& access_token) -> boost::optional<api::token_t> {
    const auto path = path_of(access_token);

    if(!path) {
        return boost::none;
    }

    fs::ifstream stream(*path);

    if(!stream) {
        return boost::none;
    }

    const std::string content{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};

    api::token_t token;

    try {
        token = decode(json::parse(content));
    } catch(const std::system_error& e) {
        OURD_LOG_WARNING(m_log, "ignoring corrupted token file '{}': {}", path->string(), error::to_string(e));
        return boost::none;
    }

    if(token.access_token != access_token) {
        OURD_LOG_WARNING(m_log, "ignoring token file '{}' issued for another token", path->string());
        return boost::none;
    }

    return token;
}

void
files_t::put(const api::token_t& token) {
    const auto path = path_of(token.access_token);

    if(!path) {
        throw error_t("access token '{}' is malformed", token.access_token);
    }

    // Written aside and renamed over, so that readers never see a partial record.
    const auto temporary = m_path / fs::unique_path(".%%%%-%%%%-%%%%");

    {
        fs::ofstream stream(temporary);
        stream << json::serialize(encode(token));

        if(!stream.flush()) {
            boost::system::error_code ignored;
            fs::remove(temporary, ignored);
            throw error_t("unable to write token file '{}'", temporary.string());
        }
    }

    boost::system::error_code ec;

    fs::rename(temporary, *path, ec);

    if(ec) {
        boost::system::error_code ignored;
        fs::remove(temporary, ignored);
        throw error_t("unable to store token file '{}' - {}", path->string(), ec.message());
    }

    OURD_LOG_DEBUG(m_log, "stored token for user '{}'", token.user_id);
}

void
files_t::remove(const std::string& access_token) {
    const auto path = path_of(access_token);

    if(!path) {
        return;
    }

    boost::system::error_code ec;

    fs::remove(*path, ec);

    if(ec) {
        OURD_LOG_WARNING(m_log, "unable to remove token file '{}': {}", path->string(), ec.message());
    }
}

auto
files_t::path_of(const std::string& access_token) const -> boost::optional<fs::path> {
    if(!valid(access_token)) {
        return boost::none;
    }

    return m_path / access_token;
}
