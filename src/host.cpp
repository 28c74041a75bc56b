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


#include "enclave/host.hpp"

#include "enclave/api/context.hpp"
#include "enclave/api/resolver.hpp"
#include "enclave/config.hpp"
#include "enclave/isolation.hpp"
#include "enclave/logging.hpp"
#include "enclave/repository.hpp"

#include "enclave/detail/context/basic.hpp"
#include "enclave/detail/essentials.hpp"
#include "enclave/detail/resolver/json.hpp"

#include <blackhole/wrapper.hpp>

using namespace enclave;

host_t::host_t(std::unique_ptr<config_t> config, std::unique_ptr<logging::logger_t> log):
    m_config(std::move(config)),
    m_log(std::move(log)),
    m_layout(m_config->path().root())
{
    ENCLAVE_LOG_INFO(m_log, "initializing the host, root: '{}'", m_layout.root().string());

    m_repository.reset(new api::repository_t(this->log("repository")));

    // Load the builtin builders.
    essentials::initialize(*m_repository);

    // Load the rest of builders.
    m_repository->load(m_config->path().plugins());

    m_resolver.reset(new resolver::json_t(m_layout));
    m_isolation.reset(new isolation_t(*this));
    m_factory.reset(new context::basic_factory_t(*this));
}

host_t::~host_t() {
    ENCLAVE_LOG_INFO(m_log, "shutting down the host");

    // The isolation manager closes the host boundary, builders loaded from it must be gone by then.
    m_factory.reset();
    m_isolation.reset();
    m_resolver.reset();
    m_repository.reset();
}

std::unique_ptr<logging::logger_t>
host_t::log(const std::string& source) const {
    return log(source, {});
}

std::unique_ptr<logging::logger_t>
host_t::log(const std::string& source, blackhole::attributes_t attributes) const {
    attributes.push_back({"source", {source}});

    return std::unique_ptr<logging::logger_t>(new blackhole::wrapper_t(*m_log, std::move(attributes)));
}

std::chrono::milliseconds
host_t::reload_interval() const {
    return m_config->deploy().reload_interval();
}

void
host_t::replace(std::unique_ptr<api::resolver_t> resolver) {
    m_resolver = std::move(resolver);
}

void
host_t::replace(std::unique_ptr<isolation_t> isolation) {
    m_isolation = std::move(isolation);
}

void
host_t::replace(std::unique_ptr<api::context_factory_t> factory) {
    m_factory = std::move(factory);
}
