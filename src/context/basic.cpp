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


#include "enclave/detail/context/basic.hpp"

#include "enclave/api/builder.hpp"
#include "enclave/api/loader.hpp"
#include "enclave/descriptor.hpp"
#include "enclave/errors.hpp"
#include "enclave/host.hpp"
#include "enclave/logging.hpp"

using namespace enclave;
using namespace enclave::context;

namespace {

const char*
describe(api::notification_t notification) {
    switch(notification) {
    case api::notification_t::started:
        return "started";
    case api::notification_t::stopping:
        return "stopping";
    }

    return "unknown";
}

} // namespace

basic_t::basic_t(std::unique_ptr<logging::logger_t> log, std::string name, api::properties_t properties):
    m_log(std::move(log)),
    m_name(std::move(name)),
    m_properties(std::move(properties)),
    m_started(false),
    m_disposed(false),
    m_listeners(std::make_shared<synchronized<listener_map_t>>()),
    m_counter(0),
    m_chamber(new io::chamber_t(m_name + "/notify"))
{
    ENCLAVE_LOG_DEBUG(m_log, "context has been created with {} propertie(s)", m_properties.size());
}

basic_t::~basic_t() {
    // Delivers whatever is still pending before the notification thread goes away.
    m_chamber.reset();
}

void
basic_t::start() {
    if(m_disposed) {
        throw error_t(std::make_error_code(std::errc::operation_not_permitted),
            "context '{}' has been disposed", m_name);
    }

    if(m_started.exchange(true)) {
        return;
    }

    ENCLAVE_LOG_INFO(m_log, "context has been started");

    notify(api::notification_t::started);
}

void
basic_t::stop() {
    if(!m_started) {
        return;
    }

    notify(api::notification_t::stopping);

    m_started = false;

    ENCLAVE_LOG_INFO(m_log, "context has been stopped");
}

void
basic_t::dispose() {
    if(m_disposed.exchange(true)) {
        return;
    }

    stop();

    ENCLAVE_LOG_INFO(m_log, "context has been disposed");

    // Pending notifications are still delivered, but nothing new can be emitted from now on.
    m_chamber->finish();
}

subscription_t
basic_t::listen(std::shared_ptr<api::listener_t> listener) {
    const auto id = m_listeners->apply([&](listener_map_t& listeners) -> std::uint64_t {
        listeners[++m_counter] = std::move(listener);
        return m_counter;
    });

    std::weak_ptr<synchronized<listener_map_t>> weak(m_listeners);

    return subscription_t([weak, id] {
        if(auto listeners = weak.lock()) {
            listeners->synchronize()->erase(id);
        }
    });
}

void
basic_t::notify(api::notification_t notification) {
    std::weak_ptr<synchronized<listener_map_t>> weak(m_listeners);
    m_chamber->get_io_service().post([weak, notification, this] {
        auto listeners = weak.lock();

        if(!listeners) {
            return;
        }

        // Listeners are allowed to unsubscribe themselves, so iterate over a snapshot.
        const auto snapshot = *listeners->synchronize();

        ENCLAVE_LOG_DEBUG(m_log, "delivering '{}' notification to {} listener(s)",
            describe(notification), snapshot.size());

        for(auto it = snapshot.begin(); it != snapshot.end(); ++it) {
            try {
                it->second->on_notification(notification);
            } catch(const std::exception& e) {
                ENCLAVE_LOG_ERROR(m_log, "unable to deliver '{}' notification: {}",
                    describe(notification), e.what());
            }
        }
    });
}

basic_factory_t::basic_factory_t(host_t& host):
    m_host(host)
{ }

std::unique_ptr<api::runtime_context_t>
basic_factory_t::create(api::builder_chain_t builders, const descriptor_t& descriptor,
                        const api::loader_t& loader)
{
    api::properties_t properties;

    for(auto it = builders.begin(); it != builders.end(); ++it) {
        (*it)->configure(properties, loader);
    }

    return std::unique_ptr<api::runtime_context_t>(new basic_t(
        m_host.log(format("context/{}", descriptor.name)),
        descriptor.name,
        std::move(properties)
    ));
}
