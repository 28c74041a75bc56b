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


#include "enclave/config.hpp"

#include "enclave/defaults.hpp"
#include "enclave/errors.hpp"

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace enclave {

namespace fs = boost::filesystem;

namespace {

const rapidjson::Value&
section(const rapidjson::Value& source, const char* name) {
    static const rapidjson::Value empty(rapidjson::kObjectType);

    const auto it = source.FindMember(name);

    if(it == source.MemberEnd()) {
        return empty;
    }

    if(!it->value.IsObject()) {
        throw error_t("\"{}\" section value should be an object", name);
    }

    return it->value;
}

std::string
string_at(const rapidjson::Value& source, const char* name, const std::string& fallback) {
    const auto it = source.FindMember(name);

    if(it == source.MemberEnd()) {
        return fallback;
    }

    if(!it->value.IsString()) {
        throw error_t("\"{}\" value should be a string", name);
    }

    return std::string(it->value.GetString(), it->value.GetStringLength());
}

std::vector<std::string>
strings_at(const rapidjson::Value& source, const char* name, std::vector<std::string> fallback) {
    const auto it = source.FindMember(name);

    if(it == source.MemberEnd()) {
        return fallback;
    }

    std::vector<std::string> result;

    if(it->value.IsString()) {
        result.emplace_back(it->value.GetString(), it->value.GetStringLength());
    } else if(it->value.IsArray()) {
        for(auto entry = it->value.Begin(); entry != it->value.End(); ++entry) {
            if(!entry->IsString()) {
                throw error_t("\"{}\" section value should be either string or array of strings", name);
            }

            result.emplace_back(entry->GetString(), entry->GetStringLength());
        }
    } else {
        throw error_t("\"{}\" section value should be either string or array of strings", name);
    }

    return result;
}

std::chrono::milliseconds
interval_at(const rapidjson::Value& source, const char* name, std::chrono::milliseconds fallback) {
    const auto it = source.FindMember(name);

    if(it == source.MemberEnd()) {
        return fallback;
    }

    if(!it->value.IsUint64() || it->value.GetUint64() == 0) {
        throw error_t("\"{}\" value should be a positive number of milliseconds", name);
    }

    return std::chrono::milliseconds(it->value.GetUint64());
}

bool
bool_at(const rapidjson::Value& source, const char* name, bool fallback) {
    const auto it = source.FindMember(name);

    if(it == source.MemberEnd()) {
        return fallback;
    }

    if(!it->value.IsBool()) {
        throw error_t("\"{}\" value should be a boolean", name);
    }

    return it->value.GetBool();
}

logging::priorities
severity_from(const std::string& name) {
    if(name == "debug") {
        return logging::debug;
    } else if(name == "info") {
        return logging::info;
    } else if(name == "warning") {
        return logging::warning;
    } else if(name == "error") {
        return logging::error;
    }

    throw error_t("unknown logging severity '{}'", name);
}

} // namespace

template<size_t Version>
struct config : public config_t {
public:
    struct path_t : public config_t::path_t {
        virtual
        const std::string&
        root() const {
            return m_root;
        }

        virtual
        const std::vector<std::string>&
        plugins() const {
            return m_plugins;
        }

        path_t(const rapidjson::Value& source):
            m_root(string_at(source, "root", defaults::root_path)),
            m_plugins(strings_at(source, "plugins", {defaults::plugins_path}))
        {
            const auto root_status = fs::status(m_root);

            if(!fs::exists(root_status)) {
                throw error_t("directory {} does not exist", m_root);
            } else if(!fs::is_directory(root_status)) {
                throw error_t("{} is not a directory", m_root);
            }
        }

        std::string m_root;
        std::vector<std::string> m_plugins;
    };

    struct deploy_t : public config_t::deploy_t {
        virtual
        std::chrono::milliseconds
        reload_interval() const {
            return m_reload_interval;
        }

        virtual
        std::chrono::milliseconds
        anchor_interval() const {
            return m_anchor_interval;
        }

        virtual
        const std::vector<std::string>&
        applications() const {
            return m_applications;
        }

        deploy_t(const rapidjson::Value& source):
            m_reload_interval(interval_at(source, "reload-interval", defaults::reload_interval)),
            m_anchor_interval(interval_at(source, "anchor-interval", defaults::anchor_interval)),
            m_applications(strings_at(source, "applications", {}))
        { }

        std::chrono::milliseconds m_reload_interval;
        std::chrono::milliseconds m_anchor_interval;
        std::vector<std::string> m_applications;
    };

    struct logging_t : public config_t::logging_t {
        virtual
        const std::string&
        loggers() const {
            return m_loggers;
        }

        virtual
        logging::priorities
        severity() const {
            return m_severity;
        }

        virtual
        const std::string&
        console() const {
            return m_console;
        }

        virtual
        bool
        colored() const {
            return m_colored;
        }

        logging_t(const rapidjson::Value& source):
            m_severity(severity_from(string_at(source, "severity", defaults::log_severity))),
            m_console(string_at(section(source, "console"), "stream", "stdout")),
            m_colored(bool_at(section(source, "console"), "colored", true))
        {
            if(m_console != "stdout" && m_console != "stderr") {
                throw error_t("unknown console stream '{}'", m_console);
            }

            rapidjson::StringBuffer buffer;
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

            section(source, "loggers").Accept(writer);

            m_loggers.assign(buffer.GetString(), buffer.GetSize());
        }

        std::string m_loggers;
        logging::priorities m_severity;
        std::string m_console;
        bool m_colored;
    };

    virtual
    const config_t::path_t&
    path() const {
        return m_path;
    }

    virtual
    const config_t::deploy_t&
    deploy() const {
        return m_deploy;
    }

    virtual
    const config_t::logging_t&
    logging() const {
        return m_logging;
    }

    static
    std::unique_ptr<rapidjson::Document>
    read_source_file(const std::string& source_file) {
        const auto source_file_status = fs::status(source_file);

        if(!fs::exists(source_file_status) || !fs::is_regular_file(source_file_status)) {
            throw error_t("configuration file path is invalid");
        }

        fs::ifstream stream(source_file);

        if(!stream) {
            throw error_t("unable to read configuration file");
        }

        rapidjson::IStreamWrapper rapid_stream(stream);

        std::unique_ptr<rapidjson::Document> doc(new rapidjson::Document());
        doc->ParseStream<rapidjson::kParseCommentsFlag | rapidjson::kParseTrailingCommasFlag>(rapid_stream);

        if(doc->HasParseError()) {
            throw error_t("configuration file is corrupted - \"{}\" on offset {}",
                rapidjson::GetParseError_En(doc->GetParseError()), doc->GetErrorOffset());
        }

        if(!doc->IsObject()) {
            throw error_t("configuration file is corrupted - top-level value is not an object");
        }

        const auto version = doc->FindMember("version");

        if(version == doc->MemberEnd() || !version->value.IsUint() || version->value.GetUint() != Version) {
            throw error_t("configuration file version is invalid");
        }

        return doc;
    }

    config(const std::string& source_file):
        m_source(read_source_file(source_file)),
        m_path(section(*m_source, "paths")),
        m_deploy(section(*m_source, "deploy")),
        m_logging(section(*m_source, "logging"))
    { }

    std::unique_ptr<rapidjson::Document> m_source;
    path_t m_path;
    deploy_t m_deploy;
    logging_t m_logging;
};

int
config_t::versions() {
    return ENCLAVE_VERSION;
}

std::unique_ptr<config_t>
make_config(const std::string& source) {
    return std::unique_ptr<config_t>(new config<1>(source));
}

} // namespace enclave
