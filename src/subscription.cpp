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


#include "enclave/subscription.hpp"

using namespace enclave;

subscription_t::subscription_t() {
    detached.test_and_set();
}

subscription_t::subscription_t(std::function<void()> callback_):
    detached(),
    callback(std::move(callback_))
{ }

subscription_t::subscription_t(subscription_t&& other):
    detached(),
    callback()
{
    if(other.detached.test_and_set()) {
        detached.test_and_set();
    } else {
        callback = std::move(other.callback);
    }
}

subscription_t&
subscription_t::operator=(subscription_t&& other) {
    if(this == &other) {
        return *this;
    }

    // The listener registered through the previous handle goes away.
    cancel();

    if(!other.detached.test_and_set()) {
        callback = std::move(other.callback);
        detached.clear();
    }

    return *this;
}

subscription_t::~subscription_t() {
    cancel();
}

bool
subscription_t::cancel() {
    if(detached.test_and_set()) {
        return false;
    }

    auto action = std::move(callback);

    if(action) {
        action();
    }

    return true;
}

bool
subscription_t::detach() {
    return !detached.test_and_set();
}
