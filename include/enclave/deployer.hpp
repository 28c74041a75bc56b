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


#ifndef ENCLAVE_DEPLOYER_HPP
#define ENCLAVE_DEPLOYER_HPP

#include "enclave/common.hpp"

namespace enclave {

/// Registry of the applications deployed on a host.
///
/// Besides the explicit operations, the deployer polls anchor markers and undeploys applications
/// whose markers have been removed by an operator.
class deployer_t {
    ENCLAVE_DECLARE_NONCOPYABLE(deployer_t)

    struct state_t;

    host_t& m_host;

    const std::unique_ptr<logging::logger_t> m_log;

    // Shared with the anchor poll, which may still be running while the deployer is destroyed.
    const std::shared_ptr<state_t> m_state;

    std::shared_ptr<monitor::scheduler_t> m_scheduler;

public:
    explicit
    deployer_t(host_t& host);

    /// Disposes every deployed application. Anchor markers are kept, so that the applications are
    /// deployed again on the next start.
   ~deployer_t();

    /// Installs, initializes and starts a new application. A failed application is disposed and
    /// forgotten.
    ///
    /// \throws error::deployment_error_t describing the failed stage, or with `already_deployed`
    ///     code.
    std::shared_ptr<application_t>
    deploy(const std::string& name);

    /// Disposes the application and removes its anchor marker.
    ///
    /// \throws error::deployment_error_t with `not_deployed` code.
    void
    undeploy(const std::string& name);

    /// \throws error::deployment_error_t describing the failed stage, or with `not_deployed` code.
    void
    redeploy(const std::string& name);

    std::shared_ptr<application_t>
    find(const std::string& name) const;

    std::vector<std::string>
    applications() const;

private:
    void
    do_undeploy(const std::string& name);

    void
    on_anchor_poll(state_t& state);
};

} // namespace enclave

#endif
