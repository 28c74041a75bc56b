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


#include "enclave/deployer.hpp"

#include "enclave/anchor.hpp"
#include "enclave/application.hpp"
#include "enclave/config.hpp"
#include "enclave/errors.hpp"
#include "enclave/host.hpp"
#include "enclave/layout.hpp"
#include "enclave/logging.hpp"
#include "enclave/monitor.hpp"

#include <mutex>

using namespace enclave;

using error::deployment_error_t;

struct deployer_t::state_t {
    state_t():
        active(true)
    { }

    // Serializes the deployer operations with the anchor poll.
    std::mutex mutex;

    // Cleared on shutdown, the anchor poll does nothing afterwards.
    bool active;

    std::map<std::string, std::shared_ptr<application_t>> applications;
};

namespace {

void
dispose(logging::logger_t& log, application_t& application) {
    try {
        application.dispose();
    } catch(const std::system_error& e) {
        ENCLAVE_LOG_ERROR(log, "unable to dispose application '{}': {}", application.name(),
            error::root_cause(e));
    }
}

} // namespace

deployer_t::deployer_t(host_t& host):
    m_host(host),
    m_log(host.log("deployer")),
    m_state(std::make_shared<state_t>())
{
    std::weak_ptr<state_t> weak(m_state);

    m_scheduler = std::make_shared<monitor::scheduler_t>(
        host.log("deployer/anchors"),
        "deployer/anchors",
        host.config().deploy().anchor_interval(),
        [this, weak] {
            if(auto state = weak.lock()) {
                on_anchor_poll(*state);
            }
        }
    );

    m_scheduler->start();
}

deployer_t::~deployer_t() {
    m_scheduler->shutdown();

    std::lock_guard<std::mutex> guard(m_state->mutex);

    // Waits for the anchor poll in progress, if any.
    m_state->active = false;

    for(auto it = m_state->applications.begin(); it != m_state->applications.end(); ++it) {
        ENCLAVE_LOG_INFO(m_log, "shutting down application '{}'", it->first);
        dispose(*m_log, *it->second);
    }

    m_state->applications.clear();
}

std::shared_ptr<application_t>
deployer_t::deploy(const std::string& name) {
    std::lock_guard<std::mutex> guard(m_state->mutex);

    if(m_state->applications.count(name)) {
        throw deployment_error_t(error::already_deployed, name, "application is already deployed");
    }

    ENCLAVE_LOG_INFO(m_log, "deploying application '{}'", name);

    auto application = std::make_shared<application_t>(m_host, name);

    try {
        application->install();
        application->init();
        application->start();
    } catch(const deployment_error_t& e) {
        ENCLAVE_LOG_ERROR(m_log, "unable to deploy application '{}': {}", name, error::to_string(e));
        dispose(*m_log, *application);
        throw;
    }

    m_state->applications[name] = application;

    ENCLAVE_LOG_INFO(m_log, "application '{}' has been deployed, identity: {}", name,
        application->to_string());

    return application;
}

void
deployer_t::undeploy(const std::string& name) {
    std::lock_guard<std::mutex> guard(m_state->mutex);
    do_undeploy(name);
}

void
deployer_t::redeploy(const std::string& name) {
    std::shared_ptr<application_t> application = find(name);

    if(!application) {
        throw deployment_error_t(error::not_deployed, name, "application is not deployed");
    }

    application->redeploy();
}

std::shared_ptr<application_t>
deployer_t::find(const std::string& name) const {
    std::lock_guard<std::mutex> guard(m_state->mutex);

    auto it = m_state->applications.find(name);

    if(it == m_state->applications.end()) {
        return nullptr;
    }

    return it->second;
}

std::vector<std::string>
deployer_t::applications() const {
    std::lock_guard<std::mutex> guard(m_state->mutex);

    std::vector<std::string> names;

    for(auto it = m_state->applications.begin(); it != m_state->applications.end(); ++it) {
        names.push_back(it->first);
    }

    return names;
}

void
deployer_t::do_undeploy(const std::string& name) {
    auto it = m_state->applications.find(name);

    if(it == m_state->applications.end()) {
        throw deployment_error_t(error::not_deployed, name, "application is not deployed");
    }

    const auto application = it->second;

    m_state->applications.erase(it);

    ENCLAVE_LOG_INFO(m_log, "undeploying application '{}'", name);

    dispose(*m_log, *application);

    anchor_t(m_host.layout().anchor(name)).remove();

    ENCLAVE_LOG_INFO(m_log, "application '{}' has been undeployed", name);
}

void
deployer_t::on_anchor_poll(state_t& state) {
    std::lock_guard<std::mutex> guard(state.mutex);

    // The deployer is being destroyed, it is not safe to touch it anymore.
    if(!state.active) {
        return;
    }

    std::vector<std::string> orphans;

    for(auto it = state.applications.begin(); it != state.applications.end(); ++it) {
        if(!anchor_t(m_host.layout().anchor(it->first)).exists()) {
            orphans.push_back(it->first);
        }
    }

    for(auto it = orphans.begin(); it != orphans.end(); ++it) {
        ENCLAVE_LOG_INFO(m_log, "anchor marker of application '{}' has been removed", *it);

        try {
            do_undeploy(*it);
        } catch(const std::system_error& e) {
            ENCLAVE_LOG_WARNING(m_log, "unable to undeploy application '{}': {}", *it, error::to_string(e));
        }
    }
}
