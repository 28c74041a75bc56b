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


#ifndef ENCLAVE_CONTEXT_API_HPP
#define ENCLAVE_CONTEXT_API_HPP

#include "enclave/api/builder.hpp"
#include "enclave/common.hpp"
#include "enclave/subscription.hpp"

namespace enclave { namespace api {

// Runtime context lifecycle notifications.
enum class notification_t {
    started,
    stopping
};

struct listener_t {
    virtual
   ~listener_t() {
        // Empty.
    }

    virtual
    void
    on_notification(notification_t notification) = 0;
};

/// The running execution environment of an application.
///
/// Notifications are delivered asynchronously: `start()` may well return before the listeners
/// observe the corresponding `started` notification.
struct runtime_context_t {
    virtual
   ~runtime_context_t() {
        // Empty.
    }

    virtual
    void
    start() = 0;

    virtual
    void
    stop() = 0;

    virtual
    void
    dispose() = 0;

    virtual
    bool
    started() const = 0;

    virtual
    bool
    disposed() const = 0;

    /// Registers a listener for lifecycle notifications. The listener stays registered until the
    /// returned subscription is cancelled or dropped.
    virtual
    subscription_t
    listen(std::shared_ptr<listener_t> listener) = 0;

    virtual
    properties_t
    properties() const = 0;
};

struct context_factory_t {
    virtual
   ~context_factory_t() {
        // Empty.
    }

    /// Runs the builders in order and creates a runtime context out of the result.
    ///
    /// \param loader The application boundary every builder resolves resources and symbols against.
    virtual
    std::unique_ptr<runtime_context_t>
    create(builder_chain_t builders, const descriptor_t& descriptor, const loader_t& loader) = 0;
};

}} // namespace enclave::api

#endif
