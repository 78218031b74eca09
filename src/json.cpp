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

#include "ourd/json.hpp"

#include "ourd/defaults.hpp"
#include "ourd/errors.hpp"

#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

#include <algorithm>

namespace ourd { namespace json {

namespace {

// This one is used instead of a dynamic constructor for simplicity and to hide rapidjson symbols.
auto dynamic_from_rapid(const rapidjson::Value& from, dynamic_t& to) -> void {
    if(from.IsArray()) {
        dynamic_t::array_t collection;
        for(auto it = from.Begin(); it != from.End(); ++it) {
            collection.push_back(dynamic_t());
            dynamic_from_rapid(*it, collection.back());
        }
        to = std::move(collection);
    } else if(from.IsObject()) {
        dynamic_t::object_t collection;
        for(auto it = from.MemberBegin(); it != from.MemberEnd(); ++it) {
            auto& element = collection[std::string(it->name.GetString(), it->name.GetStringLength())];
            dynamic_from_rapid(it->value, element);
        }
        to = std::move(collection);
    } else if(from.IsBool()) {
        to = from.GetBool();
    } else if(from.IsDouble()) {
        to = from.GetDouble();
    } else if(from.IsUint64()) { // uint check should go first, non-negative integers are unsigned
        to = dynamic_t::uint_t(from.GetUint64());
    } else if(from.IsInt64()) {
        to = dynamic_t::int_t(from.GetInt64());
    } else if(from.IsString()) {
        to = std::string(from.GetString(), from.GetStringLength());
    } else {
        to = dynamic_t::null;
    }
}

// Counts container nesting without recursion, the conversion below recurses once per level.
auto
depth_of(const rapidjson::Value& root) -> size_t {
    if(!root.IsArray() && !root.IsObject()) {
        return 0;
    }

    std::vector<std::pair<const rapidjson::Value*, size_t>> pending(1, std::make_pair(&root, size_t(1)));
    size_t result = 0;

    while(!pending.empty()) {
        const auto top = pending.back();
        pending.pop_back();

        result = std::max(result, top.second);

        if(result > defaults::json_depth) {
            break;
        }

        if(top.first->IsArray()) {
            for(auto it = top.first->Begin(); it != top.first->End(); ++it) {
                if(it->IsArray() || it->IsObject()) {
                    pending.push_back(std::make_pair(&*it, top.second + 1));
                }
            }
        } else {
            for(auto it = top.first->MemberBegin(); it != top.first->MemberEnd(); ++it) {
                if(it->value.IsArray() || it->value.IsObject()) {
                    pending.push_back(std::make_pair(&it->value, top.second + 1));
                }
            }
        }
    }

    return result;
}

template<class Writer>
class writing_visitor:
    public boost::static_visitor<void>
{
    Writer& writer;

public:
    explicit
    writing_visitor(Writer& writer_):
        writer(writer_)
    {}

    void
    operator()(const dynamic_t::null_t&) const {
        writer.Null();
    }

    void
    operator()(const dynamic_t::bool_t& value) const {
        writer.Bool(value);
    }

    void
    operator()(const dynamic_t::int_t& value) const {
        writer.Int64(value);
    }

    void
    operator()(const dynamic_t::uint_t& value) const {
        writer.Uint64(value);
    }

    void
    operator()(const dynamic_t::double_t& value) const {
        writer.Double(value);
    }

    void
    operator()(const dynamic_t::string_t& value) const {
        writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
    }

    void
    operator()(const dynamic_t::array_t& value) const {
        writer.StartArray();
        for(auto it = value.begin(); it != value.end(); ++it) {
            it->apply(*this);
        }
        writer.EndArray();
    }

    void
    operator()(const dynamic_t::object_t& value) const {
        writer.StartObject();
        for(auto it = value.begin(); it != value.end(); ++it) {
            writer.Key(it->first.data(), static_cast<rapidjson::SizeType>(it->first.size()));
            it->second.apply(*this);
        }
        writer.EndObject();
    }
};

} // namespace

dynamic_t
parse(const std::string& source, mode_t mode) {
    rapidjson::Document doc;

    // The iterative parser keeps its state on the heap, so deeply nested input cannot overflow the
    // stack while parsing.
    if(mode == mode_t::relaxed) {
        doc.Parse<rapidjson::kParseIterativeFlag |
                  rapidjson::kParseCommentsFlag |
                  rapidjson::kParseTrailingCommasFlag>(source.c_str());
    } else {
        doc.Parse<rapidjson::kParseIterativeFlag>(source.c_str());
    }

    if(doc.HasParseError()) {
        throw error_t(error::parse_error, "\"{}\" on offset {}",
            rapidjson::GetParseError_En(doc.GetParseError()), doc.GetErrorOffset());
    }

    if(depth_of(doc) > defaults::json_depth) {
        throw error_t(error::parse_error, "document is nested deeper than {} levels", defaults::json_depth);
    }

    dynamic_t root;
    dynamic_from_rapid(doc, root);

    return root;
}

std::string
serialize(const dynamic_t& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    const writing_visitor<rapidjson::Writer<rapidjson::StringBuffer>> visitor(writer);
    value.apply(visitor);

    return std::string(buffer.GetString(), buffer.GetSize());
}

}} // namespace ourd::json
