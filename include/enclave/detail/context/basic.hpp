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


#ifndef ENCLAVE_BASIC_CONTEXT_HPP
#define ENCLAVE_BASIC_CONTEXT_HPP

#include "enclave/api/context.hpp"
#include "enclave/locked_ptr.hpp"

#include "enclave/detail/chamber.hpp"

#include <atomic>

namespace enclave { namespace context {

/// Runtime context holding the configured application properties.
///
/// Lifecycle notifications are delivered on a dedicated notification thread, in the order they
/// were emitted.
class basic_t:
    public api::runtime_context_t
{
    typedef std::map<std::uint64_t, std::shared_ptr<api::listener_t>> listener_map_t;

    const std::unique_ptr<logging::logger_t> m_log;

    const std::string m_name;
    const api::properties_t m_properties;

    std::atomic<bool> m_started;
    std::atomic<bool> m_disposed;

    // Shared with subscriptions, which may outlive the context.
    const std::shared_ptr<synchronized<listener_map_t>> m_listeners;
    std::uint64_t m_counter;

    // Notification thread.
    std::unique_ptr<io::chamber_t> m_chamber;

public:
    basic_t(std::unique_ptr<logging::logger_t> log, std::string name, api::properties_t properties);

    virtual
   ~basic_t();

    virtual
    void
    start();

    virtual
    void
    stop();

    virtual
    void
    dispose();

    virtual
    bool
    started() const {
        return m_started;
    }

    virtual
    bool
    disposed() const {
        return m_disposed;
    }

    virtual
    subscription_t
    listen(std::shared_ptr<api::listener_t> listener);

    virtual
    api::properties_t
    properties() const {
        return m_properties;
    }

private:
    void
    notify(api::notification_t notification);
};

/// Default context factory, produces basic contexts.
class basic_factory_t:
    public api::context_factory_t
{
    host_t& m_host;

public:
    explicit
    basic_factory_t(host_t& host);

    virtual
    std::unique_ptr<api::runtime_context_t>
    create(api::builder_chain_t builders, const descriptor_t& descriptor, const api::loader_t& loader);
};

}} // namespace enclave::context

#endif
