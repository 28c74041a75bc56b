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


#include "enclave/application.hpp"

#include "enclave/anchor.hpp"
#include "enclave/api/context.hpp"
#include "enclave/api/resolver.hpp"
#include "enclave/assembler.hpp"
#include "enclave/errors.hpp"
#include "enclave/host.hpp"
#include "enclave/isolation.hpp"
#include "enclave/layout.hpp"
#include "enclave/logging.hpp"
#include "enclave/monitor.hpp"

using namespace enclave;

using error::deployment_error_t;

namespace fs = boost::filesystem;

application_t::application_t(host_t& host, std::string name):
    m_host(host),
    m_log(host.log(format("app/{}", name))),
    m_name(std::move(name)),
    m_generation(std::make_shared<const generation_t>())
{ }

application_t::~application_t() {
    const auto current = snapshot();

    if(current->state != state_t::uninstalled && current->state != state_t::disposed) {
        ENCLAVE_LOG_WARNING(m_log, "application is being destroyed without being disposed");
    }
}

application_t::state_t
application_t::state() const {
    return snapshot()->state;
}

application_t::snapshot_type
application_t::snapshot() const {
    return *m_generation.synchronize();
}

void
application_t::install() {
    std::lock_guard<std::mutex> guard(m_mutex);
    do_install();
}

void
application_t::init() {
    std::lock_guard<std::mutex> guard(m_mutex);
    do_init();
}

void
application_t::start() {
    std::lock_guard<std::mutex> guard(m_mutex);
    do_start();
}

void
application_t::stop() {
    std::lock_guard<std::mutex> guard(m_mutex);
    do_stop();
}

void
application_t::dispose() {
    std::lock_guard<std::mutex> guard(m_mutex);
    do_dispose();
}

void
application_t::redeploy() {
    std::lock_guard<std::mutex> guard(m_mutex);
    do_redeploy();
}

bool
application_t::redeploy(const monitor::monitor_t& origin) {
    std::lock_guard<std::mutex> guard(m_mutex);

    const auto current = snapshot();

    if(current->monitor.get() != &origin || current->state != state_t::started) {
        ENCLAVE_LOG_INFO(m_log, "ignoring a change detected by a retired monitor, state: {}",
            enclave::to_string(current->state));
        return false;
    }

    do_redeploy();

    return true;
}

std::string
application_t::to_string() const {
    return logging::identity(typeid(*this), m_name, this);
}

template<class F>
void
application_t::update(F&& mutate) {
    m_generation.apply([&](snapshot_type& current) {
        auto generation = std::make_shared<generation_t>(*current);
        mutate(*generation);
        current = std::move(generation);
    });
}

void
application_t::do_install() {
    const auto current = snapshot();

    if(current->state != state_t::uninstalled && current->state != state_t::disposed) {
        ENCLAVE_LOG_INFO(m_log, "replacing the {} generation", enclave::to_string(current->state));
        do_dispose();
    }

    ENCLAVE_LOG_INFO(m_log, "installing application");

    auto generation = std::make_shared<generation_t>();

    try {
        generation->descriptor = m_host.resolver().resolve(m_name);

        // The marker goes first, even if the installation fails later on the operator is able to
        // undeploy the application by removing it.
        anchor_t(m_host.layout().anchor(m_name)).create();

        generation->resources = m_host.layout().resolve(m_name, generation->descriptor.resources);
        generation->loader = m_host.isolation().make(generation->descriptor);
    } catch(const deployment_error_t& e) {
        ENCLAVE_LOG_ERROR(m_log, "unable to install application: {}", error::root_cause(e));
        throw;
    } catch(const std::exception& e) {
        ENCLAVE_LOG_ERROR(m_log, "unable to install application: {}", error::root_cause(e));
        std::throw_with_nested(deployment_error_t(error::installation_failed, m_name, error::root_cause(e)));
    }

    generation->state = state_t::installed;

    *m_generation.synchronize() = std::move(generation);

    ENCLAVE_LOG_INFO(m_log, "application has been installed");
}

void
application_t::do_init() {
    const auto current = snapshot();

    if(current->state != state_t::installed) {
        throw deployment_error_t(error::initialization_failed, m_name,
            format("application is not installed, state: {}", enclave::to_string(current->state)));
    }

    ENCLAVE_LOG_INFO(m_log, "initializing application");

    const descriptor_t& descriptor = current->descriptor;

    std::vector<std::string> resources;

    for(auto it = current->resources.begin(); it != current->resources.end(); ++it) {
        resources.push_back(it->string());
    }

    std::shared_ptr<api::runtime_context_t> context;
    std::shared_ptr<monitor::monitor_t> monitor;

    try {
        auto chain = assembler_t(m_host.repository()).assemble(
            descriptor,
            m_host.layout().application(m_name),
            resources,
            *current->loader
        );

        context = m_host.factory().create(std::move(chain), descriptor, *current->loader);

        if(descriptor.redeployment && !current->resources.empty()) {
            monitor = std::make_shared<monitor::monitor_t>(
                m_host,
                shared_from_this(),
                m_name,
                current->resources.front(),
                m_host.reload_interval()
            );

            monitor->attach(context->listen(monitor));
        }
    } catch(const std::exception& e) {
        ENCLAVE_LOG_ERROR(m_log, "unable to initialize application: {}", error::root_cause(e));

        if(monitor) {
            monitor->cancel();
        }

        if(context) {
            try {
                context->dispose();
            } catch(const std::exception& inner) {
                ENCLAVE_LOG_WARNING(m_log, "unable to dispose the runtime context: {}", inner.what());
            }
        }

        std::throw_with_nested(deployment_error_t(error::initialization_failed, m_name, error::root_cause(e)));
    }

    update([&](generation_t& generation) {
        generation.context = context;
        generation.monitor = monitor;
        generation.state = state_t::initialized;
    });

    ENCLAVE_LOG_INFO(m_log, "application has been initialized");
}

void
application_t::do_start() {
    const auto current = snapshot();

    if(!current->context) {
        throw deployment_error_t(error::start_failed, m_name,
            format("application is not initialized, state: {}", enclave::to_string(current->state)));
    }

    ENCLAVE_LOG_INFO(m_log, "starting application");

    try {
        current->context->start();
    } catch(const std::exception& e) {
        ENCLAVE_LOG_ERROR(m_log, "unable to start application: {}", error::root_cause(e));
        std::throw_with_nested(deployment_error_t(error::start_failed, m_name, error::root_cause(e)));
    }

    update([](generation_t& generation) {
        generation.state = state_t::started;
    });

    ENCLAVE_LOG_INFO(m_log, "application has been started");
}

void
application_t::do_stop() {
    const auto current = snapshot();

    if(!current->context) {
        // Never initialized, maybe due to a previous error.
        return;
    }

    ENCLAVE_LOG_INFO(m_log, "stopping application");

    try {
        current->context->stop();
    } catch(const std::exception& e) {
        ENCLAVE_LOG_ERROR(m_log, "unable to stop application: {}", error::root_cause(e));
        std::throw_with_nested(deployment_error_t(error::stop_failed, m_name, error::root_cause(e)));
    }

    update([](generation_t& generation) {
        generation.state = state_t::stopped;
    });

    ENCLAVE_LOG_INFO(m_log, "application has been stopped");
}

void
application_t::do_dispose() {
    const auto current = snapshot();

    if(current->state == state_t::uninstalled || current->state == state_t::disposed) {
        return;
    }

    ENCLAVE_LOG_INFO(m_log, "disposing application");

    std::exception_ptr failure;

    if(const auto& context = current->context) {
        if(context->started() && !context->disposed()) {
            try {
                do_stop();
            } catch(const deployment_error_t& e) {
                ENCLAVE_LOG_WARNING(m_log, "ignoring stop failure while disposing: {}", error::root_cause(e));
            }
        }

        if(current->monitor) {
            current->monitor->cancel();
        }

        try {
            context->dispose();
        } catch(const std::exception& e) {
            ENCLAVE_LOG_ERROR(m_log, "unable to dispose the runtime context: {}", error::root_cause(e));
            failure = std::current_exception();
        }
    }

    // The boundary is closed on every path, the generation drops the last references to it.
    if(current->loader) {
        current->loader->close();
    }

    auto generation = std::make_shared<generation_t>();

    generation->descriptor = current->descriptor;
    generation->state = state_t::disposed;

    *m_generation.synchronize() = std::move(generation);

    if(failure) {
        std::rethrow_exception(failure);
    }

    ENCLAVE_LOG_INFO(m_log, "application has been disposed");
}

void
application_t::do_redeploy() {
    ENCLAVE_LOG_INFO(m_log, "redeploying application");

    do_dispose();
    do_install();
    do_init();
    do_start();

    ENCLAVE_LOG_INFO(m_log, "application has been redeployed");
}

std::string
enclave::to_string(application_t::state_t state) {
    switch(state) {
    case application_t::state_t::uninstalled:
        return "uninstalled";
    case application_t::state_t::installed:
        return "installed";
    case application_t::state_t::initialized:
        return "initialized";
    case application_t::state_t::started:
        return "started";
    case application_t::state_t::stopped:
        return "stopped";
    case application_t::state_t::disposed:
        return "disposed";
    }

    return "unknown";
}
