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


#include "enclave/detail/runtime/pid_file.hpp"

#include "enclave/errors.hpp"

#include <csignal>
#include <iostream>

#include <boost/filesystem/convenience.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <sys/types.h>
#include <unistd.h>

using namespace enclave;

namespace fs = boost::filesystem;

pid_file_t::pid_file_t(const fs::path& filepath):
    m_filepath(filepath)
{
    // If the pidfile exists, check if the process is still active.
    if(fs::exists(m_filepath)) {
        pid_t pid = 0;
        fs::ifstream stream(m_filepath);

        if(!stream || !(stream >> pid)) {
            throw error_t("unable to read '{}'", m_filepath.string());
        }

        if(::kill(pid, 0) < 0 && errno == ESRCH) {
            // Unlink the stale pid file.
            remove();
        } else {
            throw error_t("another process with pid {} is active", pid);
        }
    }

    fs::ofstream stream(m_filepath);

    if(!stream) {
        throw error_t("unable to write '{}'", m_filepath.string());
    }

    stream << ::getpid();
    stream.close();
}

pid_file_t::~pid_file_t() {
    try {
        remove();
    } catch(const std::system_error& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
    }
}

void
pid_file_t::remove() {
    boost::system::error_code ec;

    fs::remove(m_filepath, ec);

    if(ec) {
        throw error_t("unable to remove '{}' - {}", m_filepath.string(), ec.message());
    }
}
