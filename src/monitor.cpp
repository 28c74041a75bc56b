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


#include "enclave/monitor.hpp"

#include "enclave/application.hpp"
#include "enclave/errors.hpp"
#include "enclave/host.hpp"
#include "enclave/logging.hpp"

#include <boost/filesystem/path.hpp>

#include <sys/stat.h>

using namespace enclave;
using namespace enclave::monitor;

namespace fs = boost::filesystem;

// Watcher

watcher_t::watcher_t(const fs::path& path):
    m_path(path),
    m_observed(observe())
{ }

bool
watcher_t::changed() {
    const auto current = observe();

    if(current == m_observed) {
        return false;
    }

    m_observed = current;

    return true;
}

boost::optional<watcher_t::stamp_t>
watcher_t::observe() const {
    struct stat info;

    // A file which has temporarily vanished, for example while being rewritten by an editor, counts
    // as a modification once it is back.
    if(::stat(m_path.c_str(), &info) != 0) {
        return boost::none;
    }

    stamp_t stamp;

    stamp.seconds = info.st_mtim.tv_sec;
    stamp.nanoseconds = info.st_mtim.tv_nsec;
    stamp.size = static_cast<std::uintmax_t>(info.st_size);

    return stamp;
}

// Scheduler

scheduler_t::scheduler_t(std::unique_ptr<logging::logger_t> log, const std::string& name,
                         std::chrono::milliseconds interval, action_type action):
    m_log(std::move(log)),
    m_interval(interval),
    m_action(std::move(action)),
    m_chamber(name),
    m_timer(m_chamber.get_io_service()),
    m_cancelled(false)
{ }

scheduler_t::~scheduler_t() {
    shutdown();
}

void
scheduler_t::start() {
    ENCLAVE_LOG_DEBUG(m_log, "scheduling polls every {} ms", m_interval.count());

    schedule();
}

void
scheduler_t::shutdown() {
    const bool cancelled = m_timer.apply([&](boost::asio::deadline_timer& timer) {
        if(m_cancelled.exchange(true)) {
            return true;
        }

        boost::system::error_code ec;
        timer.cancel(ec);

        return false;
    });

    if(cancelled) {
        return;
    }

    // The cancelled wait completes right away, then the thread runs out of work and exits.
    m_chamber.finish();

    ENCLAVE_LOG_DEBUG(m_log, "scheduler has been shut down");
}

void
scheduler_t::schedule() {
    m_timer.apply([&](boost::asio::deadline_timer& timer) {
        if(m_cancelled) {
            return;
        }

        timer.expires_from_now(boost::posix_time::milliseconds(m_interval.count()));
        timer.async_wait(std::bind(&scheduler_t::on_timer, shared_from_this(), std::placeholders::_1));
    });
}

void
scheduler_t::on_timer(const boost::system::error_code& ec) {
    if(ec == boost::asio::error::operation_aborted || m_cancelled) {
        return;
    }

    try {
        m_action();
    } catch(const std::exception& e) {
        ENCLAVE_LOG_ERROR(m_log, "unable to complete the scheduled action: {}", error::root_cause(e));
    }

    schedule();
}

// Monitor

monitor_t::monitor_t(host_t& host, std::weak_ptr<application_t> application, std::string name,
                     const fs::path& path, std::chrono::milliseconds interval):
    m_host(host),
    m_log(host.log(format("reload/{}", name))),
    m_application(std::move(application)),
    m_name(std::move(name)),
    m_interval(interval),
    m_watcher(path)
{
    ENCLAVE_LOG_DEBUG(m_log, "watching '{}' for changes", path.string());
}

monitor_t::~monitor_t() {
    cancel();
}

void
monitor_t::attach(subscription_t subscription) {
    *m_subscription.synchronize() = std::move(subscription);
}

void
monitor_t::on_notification(api::notification_t notification) {
    switch(notification) {
    case api::notification_t::started:
        on_started();
        break;
    case api::notification_t::stopping:
        on_stopping();
        break;
    }
}

bool
monitor_t::armed() const {
    return m_scheduler.apply([](const std::shared_ptr<scheduler_t>& scheduler) {
        return scheduler && !scheduler->cancelled();
    });
}

void
monitor_t::cancel() {
    std::shared_ptr<scheduler_t> scheduler;

    m_scheduler.synchronize()->swap(scheduler);

    if(scheduler) {
        scheduler->shutdown();
    }

    m_subscription.synchronize()->cancel();
}

void
monitor_t::on_started() {
    std::weak_ptr<monitor_t> weak(shared_from_this());

    auto scheduler = std::make_shared<scheduler_t>(
        m_host.log(format("reload/{}/scheduler", m_name)),
        format("reload/{}", m_name),
        m_interval,
        [weak] {
            if(auto self = weak.lock()) {
                self->on_poll();
            }
        }
    );

    std::shared_ptr<scheduler_t> previous;

    m_scheduler.apply([&](std::shared_ptr<scheduler_t>& current) {
        previous = std::move(current);
        current = scheduler;
    });

    if(previous) {
        previous->shutdown();
    }

    scheduler->start();

    ENCLAVE_LOG_INFO(m_log, "hot-redeploy monitor has been armed");
}

void
monitor_t::on_stopping() {
    cancel();

    ENCLAVE_LOG_INFO(m_log, "hot-redeploy monitor has been disarmed");
}

void
monitor_t::on_poll() {
    if(!m_watcher.synchronize()->changed()) {
        return;
    }

    auto application = m_application.lock();

    if(!application) {
        ENCLAVE_LOG_DEBUG(m_log, "application is gone, ignoring the change");
        return;
    }

    ENCLAVE_LOG_INFO(m_log, "'{}' has been modified, redeploying", m_watcher.synchronize()->path().string());

    try {
        application->redeploy(*this);
    } catch(const std::system_error& e) {
        ENCLAVE_LOG_ERROR(m_log, "unable to redeploy: {} - {}", error::to_string(e), error::root_cause(e));
    }
}
