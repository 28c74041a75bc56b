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


#ifndef ENCLAVE_MONITOR_HPP
#define ENCLAVE_MONITOR_HPP

#include "enclave/api/context.hpp"
#include "enclave/common.hpp"
#include "enclave/locked_ptr.hpp"
#include "enclave/subscription.hpp"

#include "enclave/detail/chamber.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>

#include <boost/asio/deadline_timer.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/optional/optional.hpp>

namespace enclave { namespace monitor {

/// Detects modifications of a single file by its last-modified time.
class watcher_t {
public:
    // Modification time down to nanoseconds, and the size, which tells apart two edits landing on
    // the same timestamp of a filesystem with a coarse clock.
    struct stamp_t {
        std::time_t seconds;
        long nanoseconds;
        std::uintmax_t size;

        bool
        operator==(const stamp_t& other) const {
            return seconds == other.seconds && nanoseconds == other.nanoseconds && size == other.size;
        }
    };

private:
    const boost::filesystem::path m_path;

    // Last observed stamp, none if the file could not be observed.
    boost::optional<stamp_t> m_observed;

public:
    explicit
    watcher_t(const boost::filesystem::path& path);

    const boost::filesystem::path&
    path() const {
        return m_path;
    }

    /// Compares the current stamp with the previously observed one and remembers it.
    bool
    changed();

private:
    boost::optional<stamp_t>
    observe() const;
};

/// Single-thread periodic scheduler.
///
/// The action is invoked every `interval` on the scheduler's own thread, never concurrently with
/// itself. A scheduler is good for one cycle only: once shut down it can not be restarted.
class scheduler_t:
    public std::enable_shared_from_this<scheduler_t>
{
public:
    typedef std::function<void()> action_type;

private:
    const std::unique_ptr<logging::logger_t> m_log;
    const std::chrono::milliseconds m_interval;
    const action_type m_action;

    io::chamber_t m_chamber;
    synchronized<boost::asio::deadline_timer> m_timer;

    std::atomic<bool> m_cancelled;

public:
    scheduler_t(std::unique_ptr<logging::logger_t> log, const std::string& name,
                std::chrono::milliseconds interval, action_type action);

   ~scheduler_t();

    void
    start();

    /// Drops the pending polls. An action which is being run right now runs to completion, this
    /// call does not wait for it.
    void
    shutdown();

    bool
    cancelled() const {
        return m_cancelled;
    }

private:
    void
    schedule();

    void
    on_timer(const boost::system::error_code& ec);
};

/// Hot-redeploy monitor of a single application generation.
///
/// Registered as a runtime context listener: the scheduler is created when the context reports it
/// has been started and is shut down, along with the subscription itself, when the context starts
/// stopping.
class monitor_t:
    public api::listener_t,
    public std::enable_shared_from_this<monitor_t>
{
    host_t& m_host;

    const std::unique_ptr<logging::logger_t> m_log;

    const std::weak_ptr<application_t> m_application;
    const std::string m_name;
    const std::chrono::milliseconds m_interval;

    // Created once in the constructor, so the first observation happens at initialization time.
    synchronized<watcher_t> m_watcher;

    synchronized<std::shared_ptr<scheduler_t>> m_scheduler;
    synchronized<subscription_t> m_subscription;

public:
    monitor_t(host_t& host, std::weak_ptr<application_t> application, std::string name,
              const boost::filesystem::path& path, std::chrono::milliseconds interval);

    virtual
   ~monitor_t();

    /// Takes the ownership of the listener registration.
    void
    attach(subscription_t subscription);

    virtual
    void
    on_notification(api::notification_t notification);

    bool
    armed() const;

    /// Disarms the monitor and unregisters it.
    void
    cancel();

private:
    void
    on_started();

    void
    on_stopping();

    void
    on_poll();
};

}} // namespace enclave::monitor

#endif
