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


#ifndef ENCLAVE_HOST_HPP
#define ENCLAVE_HOST_HPP

#include "enclave/common.hpp"
#include "enclave/layout.hpp"

#include <chrono>

#include <blackhole/attributes.hpp>

namespace enclave {

/// Process-wide collaborators shared by every application: the configuration, the logger, the
/// installation layout, the builder repository, the descriptor resolver, the isolation manager and
/// the runtime context factory.
///
/// The host must outlive every application created against it.
class host_t {
    ENCLAVE_DECLARE_NONCOPYABLE(host_t)

    const std::unique_ptr<config_t> m_config;
    const std::unique_ptr<logging::logger_t> m_log;

    const layout_t m_layout;

    std::unique_ptr<api::repository_t> m_repository;
    std::unique_ptr<api::resolver_t> m_resolver;
    std::unique_ptr<isolation_t> m_isolation;
    std::unique_ptr<api::context_factory_t> m_factory;

public:
    host_t(std::unique_ptr<config_t> config, std::unique_ptr<logging::logger_t> log);

   ~host_t();

    std::unique_ptr<logging::logger_t>
    log(const std::string& source) const;

    std::unique_ptr<logging::logger_t>
    log(const std::string& source, blackhole::attributes_t attributes) const;

    const config_t&
    config() const {
        return *m_config;
    }

    const layout_t&
    layout() const {
        return m_layout;
    }

    std::chrono::milliseconds
    reload_interval() const;

    api::repository_t&
    repository() const {
        return *m_repository;
    }

    const api::resolver_t&
    resolver() const {
        return *m_resolver;
    }

    const isolation_t&
    isolation() const {
        return *m_isolation;
    }

    api::context_factory_t&
    factory() const {
        return *m_factory;
    }

    // Collaborator replacement, must happen before any application is created.

    void
    replace(std::unique_ptr<api::resolver_t> resolver);

    void
    replace(std::unique_ptr<isolation_t> isolation);

    void
    replace(std::unique_ptr<api::context_factory_t> factory);
};

} // namespace enclave

#endif
