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


#include "enclave/anchor.hpp"

#include "enclave/defaults.hpp"
#include "enclave/errors.hpp"

#include <boost/filesystem/convenience.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

using namespace enclave;

namespace fs = boost::filesystem;

anchor_t::anchor_t(const fs::path& filepath):
    m_filepath(filepath)
{ }

void
anchor_t::create() const {
    boost::system::error_code ec;

    fs::create_directories(m_filepath.parent_path(), ec);

    if(ec) {
        throw error_t(std::error_code(ec.value(), std::system_category()),
            "unable to create '{}'", m_filepath.parent_path().string());
    }

    fs::ofstream stream(m_filepath, std::ios::out | std::ios::trunc);

    if(!stream) {
        throw error_t(std::make_error_code(std::errc::io_error), "unable to write '{}'",
            m_filepath.string());
    }

    stream << defaults::anchor_blurb;
    stream.close();

    if(!stream) {
        throw error_t(std::make_error_code(std::errc::io_error), "unable to write '{}'",
            m_filepath.string());
    }
}

bool
anchor_t::exists() const {
    boost::system::error_code ec;
    return fs::is_regular_file(m_filepath, ec);
}

void
anchor_t::remove() const {
    try {
        fs::remove(m_filepath);
    } catch(const fs::filesystem_error& e) {
        throw error_t(std::error_code(e.code().value(), std::system_category()),
            "unable to remove '{}'", m_filepath.string());
    }
}
