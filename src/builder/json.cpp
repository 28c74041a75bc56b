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


#include "enclave/detail/builder/json.hpp"

#include "enclave/errors.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/lexical_cast.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>

using namespace enclave;
using namespace enclave::builder;

namespace fs = boost::filesystem;

namespace {

void
flatten(const std::string& prefix, const rapidjson::Value& value, api::properties_t& properties) {
    if(value.IsObject()) {
        for(auto it = value.MemberBegin(); it != value.MemberEnd(); ++it) {
            const std::string name(it->name.GetString(), it->name.GetStringLength());
            flatten(prefix.empty() ? name : prefix + "." + name, it->value, properties);
        }
    } else if(value.IsString()) {
        properties[prefix] = expand(std::string(value.GetString(), value.GetStringLength()), properties);
    } else if(value.IsBool()) {
        properties[prefix] = value.GetBool() ? "true" : "false";
    } else if(value.IsInt64()) {
        properties[prefix] = boost::lexical_cast<std::string>(value.GetInt64());
    } else if(value.IsUint64()) {
        properties[prefix] = boost::lexical_cast<std::string>(value.GetUint64());
    } else if(value.IsDouble()) {
        properties[prefix] = boost::lexical_cast<std::string>(value.GetDouble());
    } else if(value.IsNull()) {
        properties.erase(prefix);
    } else {
        throw error_t("unable to configure '{}' - arrays are not supported", prefix);
    }
}

void
apply_plain(const std::string& resource, api::properties_t& properties) {
    fs::ifstream stream(resource);

    if(!stream) {
        throw error_t(std::make_error_code(std::errc::io_error), "unable to read '{}'", resource);
    }

    std::string line;

    for(size_t number = 1; std::getline(stream, line); ++number) {
        boost::trim(line);

        if(line.empty() || line[0] == '#') {
            continue;
        }

        const auto separator = line.find('=');

        if(separator == std::string::npos) {
            throw error_t("'{}', line {}: expected 'key = value'", resource, number);
        }

        const std::string key = boost::trim_copy(line.substr(0, separator));
        const std::string value = boost::trim_copy(line.substr(separator + 1));

        properties[key] = expand(value, properties);
    }
}

} // namespace

std::string
enclave::builder::expand(const std::string& value, const api::properties_t& properties) {
    std::string result;
    std::string::size_type position = 0;

    while(true) {
        const auto begin = value.find("${", position);

        if(begin == std::string::npos) {
            break;
        }

        const auto end = value.find('}', begin + 2);

        if(end == std::string::npos) {
            break;
        }

        const auto it = properties.find(value.substr(begin + 2, end - begin - 2));

        result.append(value, position, begin - position);

        if(it != properties.end()) {
            result.append(it->second);
        } else {
            result.append(value, begin, end - begin + 1);
        }

        position = end + 1;
    }

    return result.append(value, position, std::string::npos);
}

json_t::json_t(const std::vector<std::string>& resources):
    m_resources(resources)
{ }

void
json_t::configure(api::properties_t& properties, const api::loader_t& /* loader */) {
    for(auto it = m_resources.begin(); it != m_resources.end(); ++it) {
        apply(*it, properties);
    }
}

void
json_t::apply(const std::string& resource, api::properties_t& properties) {
    fs::ifstream stream(resource);

    if(!stream) {
        throw error_t(std::make_error_code(std::errc::io_error), "unable to read '{}'", resource);
    }

    rapidjson::IStreamWrapper wrapper(stream);
    rapidjson::Document root;

    root.ParseStream(wrapper);

    if(root.HasParseError()) {
        throw error_t("'{}': {} at offset {}", resource,
            rapidjson::GetParseError_En(root.GetParseError()), root.GetErrorOffset());
    }

    if(!root.IsObject()) {
        throw error_t("'{}': top-level value is not an object", resource);
    }

    flatten(std::string(), root, properties);
}

auto_t::auto_t(const std::vector<std::string>& resources):
    m_resources(resources)
{ }

void
auto_t::configure(api::properties_t& properties, const api::loader_t& /* loader */) {
    for(auto it = m_resources.begin(); it != m_resources.end(); ++it) {
        const auto extension = fs::path(*it).extension();

        if(extension == ".json") {
            json_t::apply(*it, properties);
        } else if(extension == ".properties") {
            apply_plain(*it, properties);
        } else {
            throw error_t("no configuration builder is able to handle '{}'", *it);
        }
    }
}
