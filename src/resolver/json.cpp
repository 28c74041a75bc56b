/*
    Copyright (c) 2011-2015 Andrey Sibiryov <me@kobology.ru>
    Copyright (c) 2011-2015 Other contributors as noted in the AUTHORS file.

    This file is part of Enclave.

    Enclave is free software; you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.

    Enclave is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/


#include "enclave/detail/resolver/json.hpp"

#include "enclave/defaults.hpp"
#include "enclave/errors.hpp"

#include <algorithm>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/lexical_cast.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>

using namespace enclave;
using namespace enclave::resolver;

namespace fs = boost::filesystem;

namespace {

auto
as_string(const std::string& field, const rapidjson::Value& value) -> std::string {
    if(value.IsString()) {
        return std::string(value.GetString(), value.GetStringLength());
    } else if(value.IsBool()) {
        return value.GetBool() ? "true" : "false";
    } else if(value.IsInt64()) {
        return boost::lexical_cast<std::string>(value.GetInt64());
    } else if(value.IsUint64()) {
        return boost::lexical_cast<std::string>(value.GetUint64());
    } else if(value.IsDouble()) {
        return boost::lexical_cast<std::string>(value.GetDouble());
    }

    throw error_t(error::invalid_descriptor_value, "field '{}' must be a scalar", field);
}

// Accepts both an array of strings and a single comma-separated string.
auto
as_list(const std::string& field, const rapidjson::Value& value) -> std::vector<std::string> {
    std::vector<std::string> result;

    if(value.IsArray()) {
        for(auto it = value.Begin(); it != value.End(); ++it) {
            result.push_back(as_string(field, *it));
        }
    } else if(value.IsString()) {
        const std::string source(value.GetString(), value.GetStringLength());
        boost::split(result, source, boost::is_any_of(","));
    } else {
        throw error_t(error::invalid_descriptor_value, "field '{}' must be a list of strings", field);
    }

    for(auto it = result.begin(); it != result.end(); ++it) {
        boost::trim(*it);
    }

    result.erase(std::remove(result.begin(), result.end(), std::string()), result.end());

    return result;
}

} // namespace

json_t::json_t(const layout_t& layout):
    m_layout(layout)
{ }

descriptor_t
json_t::resolve(const std::string& name) const {
    descriptor_t descriptor;

    descriptor.name      = name;
    descriptor.resources = { defaults::config_resource };
    descriptor.domain    = defaults::default_domain;

    const fs::path path = m_layout.descriptor(name);

    if(!fs::exists(path)) {
        return descriptor;
    }

    fs::ifstream stream(path);

    if(!stream) {
        throw error_t(error::descriptor_unreadable, "unable to read '{}'", path.string());
    }

    rapidjson::IStreamWrapper wrapper(stream);
    rapidjson::Document root;

    root.ParseStream(wrapper);

    if(root.HasParseError()) {
        throw error_t(error::descriptor_malformed, "'{}': {} at offset {}", path.string(),
            rapidjson::GetParseError_En(root.GetParseError()), root.GetErrorOffset());
    }

    if(!root.IsObject()) {
        throw error_t(error::descriptor_malformed, "'{}': top-level value is not an object",
            path.string());
    }

    if(root.HasMember("resources")) {
        descriptor.resources = as_list("resources", root["resources"]);
    }

    if(descriptor.resources.empty()) {
        throw error_t(error::invalid_descriptor_value, "'{}': no config resources specified",
            path.string());
    }

    if(root.HasMember("domain")) {
        descriptor.domain = as_string("domain", root["domain"]);
    }

    if(root.HasMember("builder")) {
        descriptor.builder = as_string("builder", root["builder"]);
    }

    if(root.HasMember("scan")) {
        descriptor.packages = as_list("scan", root["scan"]);
    }

    if(root.HasMember("redeployment")) {
        const auto& value = root["redeployment"];

        if(!value.IsBool()) {
            throw error_t(error::invalid_descriptor_value, "field 'redeployment' must be a boolean");
        }

        descriptor.redeployment = value.GetBool();
    }

    if(root.HasMember("properties")) {
        const auto& properties = root["properties"];

        if(!properties.IsObject()) {
            throw error_t(error::invalid_descriptor_value, "field 'properties' must be an object");
        }

        for(auto it = properties.MemberBegin(); it != properties.MemberEnd(); ++it) {
            const std::string key(it->name.GetString(), it->name.GetStringLength());
            descriptor.properties[key] = as_string(key, it->value);
        }
    }

    return descriptor;
}
