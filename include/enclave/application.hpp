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


#ifndef ENCLAVE_APPLICATION_HPP
#define ENCLAVE_APPLICATION_HPP

#include "enclave/api/loader.hpp"
#include "enclave/common.hpp"
#include "enclave/descriptor.hpp"
#include "enclave/locked_ptr.hpp"

#include <mutex>

#include <boost/filesystem/path.hpp>

namespace enclave {

/// The unit of deployment.
///
/// An application is driven through install -> init -> start -> stop -> dispose, and can be
/// redeployed as a whole. Every lifecycle operation is serialized with the others. All the state of
/// one install-to-dispose lifetime lives in an immutable generation, which is replaced as a whole on
/// every transition, so readers always observe a consistent snapshot.
///
/// Applications must be owned by a `std::shared_ptr`: the hot-redeploy monitor refers to them
/// weakly.
class application_t:
    public std::enable_shared_from_this<application_t>
{
    ENCLAVE_DECLARE_NONCOPYABLE(application_t)

public:
    enum class state_t {
        uninstalled,
        installed,
        initialized,
        started,
        stopped,
        disposed
    };

    struct generation_t {
        generation_t():
            state(state_t::uninstalled)
        { }

        descriptor_t descriptor;

        // Absolute config resource paths, in the descriptor order.
        std::vector<boost::filesystem::path> resources;

        api::loader_t::ptr_type loader;
        std::shared_ptr<api::runtime_context_t> context;
        std::shared_ptr<monitor::monitor_t> monitor;

        state_t state;
    };

    typedef std::shared_ptr<const generation_t> snapshot_type;

private:
    host_t& m_host;

    const std::unique_ptr<logging::logger_t> m_log;

    const std::string m_name;

    // Serializes lifecycle operations.
    std::mutex m_mutex;

    synchronized<snapshot_type> m_generation;

public:
    application_t(host_t& host, std::string name);

   ~application_t();

    const std::string&
    name() const {
        return m_name;
    }

    state_t
    state() const;

    snapshot_type
    snapshot() const;

    /// Installs a new generation. A live generation, if any, is disposed of first, so that its
    /// boundary is closed before the new one is built.
    ///
    /// \throws error::deployment_error_t with `installation_failed` or `domain_not_found` code.
    void
    install();

    /// \throws error::deployment_error_t with `initialization_failed` code.
    void
    init();

    /// \throws error::deployment_error_t with `start_failed` code.
    void
    start();

    /// Does nothing if there is no runtime context yet.
    ///
    /// \throws error::deployment_error_t with `stop_failed` code.
    void
    stop();

    /// Stops the application if needed, disposes the runtime context and closes the application
    /// boundary. Stop failures are logged and otherwise ignored. Subsequent calls do nothing.
    void
    dispose();

    /// Disposes the current generation, then installs, initializes and starts a new one. Stage
    /// failures are propagated unchanged.
    void
    redeploy();

    /// Redeploys on behalf of a hot-redeploy monitor. Nothing happens unless the monitor belongs
    /// to the current generation and the application is running, so a change detected right before
    /// the generation goes away can not resurrect the application.
    ///
    /// \returns `true` if the application has been redeployed.
    bool
    redeploy(const monitor::monitor_t& origin);

    std::string
    to_string() const;

private:
    void
    do_install();

    void
    do_init();

    void
    do_start();

    void
    do_stop();

    void
    do_dispose();

    void
    do_redeploy();

    template<class F>
    void
    update(F&& mutate);
};

std::string
to_string(application_t::state_t state);

} // namespace enclave

#endif
