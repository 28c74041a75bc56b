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


#include "enclave/detail/chamber.hpp"

#if defined(__linux__)
    #include <sys/prctl.h>
#elif defined(__APPLE__)
    #include <pthread.h>
#endif

using namespace enclave::io;

// Chamber internals

class chamber_t::named_runnable_t {
    const std::string name;

    // Owned, so that a detached thread never outlives its event loop.
    const std::shared_ptr<boost::asio::io_service> asio;

public:
    named_runnable_t(const std::string& name_, const std::shared_ptr<boost::asio::io_service>& asio_):
        name(name_),
        asio(asio_)
    { }

    void
    operator()() const;
};

void
chamber_t::named_runnable_t::operator()() const {
#if defined(__linux__)
    if(name.size() < 16) {
        ::prctl(PR_SET_NAME, name.c_str());
    } else {
        ::prctl(PR_SET_NAME, name.substr(0, 15).c_str());
    }
#elif defined(__APPLE__)
    pthread_setname_np(name.c_str());
#endif

    asio->run();
}

// Chamber

chamber_t::chamber_t(const std::string& name_):
    name(name_),
    asio(std::make_shared<boost::asio::io_service>()),
    work(new boost::asio::io_service::work(*asio))
{
    thread.reset(new boost::thread(named_runnable_t(name, asio)));
}

chamber_t::~chamber_t() {
    finish();

    if(current()) {
        thread->detach();
    } else {
        thread->join();
    }
}

void
chamber_t::finish() {
    std::lock_guard<std::mutex> guard(mutex);
    work.reset();
}

bool
chamber_t::current() const {
    return thread->get_id() == boost::this_thread::get_id();
}
