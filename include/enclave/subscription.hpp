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


#ifndef ENCLAVE_SUBSCRIPTION_HPP
#define ENCLAVE_SUBSCRIPTION_HPP

#include <atomic>
#include <functional>

namespace enclave {

/// Handle to a registered notification listener.
///
/// The handle is returned by the registration call and is the only way to unregister the
/// listener. Cancellation is idempotent and safe to call from within the listener itself.
class subscription_t {
    std::atomic_flag detached;
    std::function<void()> callback;

public:
    subscription_t();
    explicit
    subscription_t(std::function<void()> callback);
    subscription_t(const subscription_t&) = delete;
    subscription_t& operator=(const subscription_t&) = delete;
    subscription_t(subscription_t&&);
    subscription_t& operator=(subscription_t&&);

   ~subscription_t();

    /// Unregisters the listener unless it was already unregistered or detached.
    ///
    /// \returns `true` if this call performed the unregistration.
    bool
    cancel();

    /// Forgets about the listener, so neither the destructor nor `cancel()` unregister it.
    bool
    detach();
};

} // namespace enclave

#endif
