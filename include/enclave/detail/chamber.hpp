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


#ifndef ENCLAVE_CHAMBER_HPP
#define ENCLAVE_CHAMBER_HPP

#include "enclave/common.hpp"

#include <mutex>

#include <boost/asio/io_service.hpp>
#include <boost/thread/thread.hpp>

namespace enclave { namespace io {

/// A named thread running its own event loop.
///
/// The loop keeps running until `finish()` is called and the queued handlers are drained.
/// Destroying a chamber from its own thread detaches the thread instead of joining it, the loop
/// finishes on its own.
class chamber_t {
    class named_runnable_t;

    const std::string name;
    const std::shared_ptr<boost::asio::io_service> asio;

    std::unique_ptr<boost::asio::io_service::work> work;
    std::mutex mutex;

    // This thread will run the reactor's event loop until terminated.
    std::unique_ptr<boost::thread> thread;

public:
    explicit
    chamber_t(const std::string& name);

   ~chamber_t();

    auto
    get_io_service() const -> boost::asio::io_service& {
        return *asio;
    }

    /// Lets the already queued handlers run, then the thread exits.
    void
    finish();

    bool
    current() const;
};

}} // namespace enclave::io

#endif
