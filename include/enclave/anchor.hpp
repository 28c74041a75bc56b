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


#ifndef ENCLAVE_ANCHOR_HPP
#define ENCLAVE_ANCHOR_HPP

#include "enclave/common.hpp"

#include <boost/filesystem/path.hpp>

namespace enclave {

/// Anchor marker of a deployed application.
///
/// The marker is a plain file next to the application directory. Its presence means "deployed", an
/// operator removes it to request a clean undeploy. Unlike a pid file it is never removed on
/// destruction: it must survive redeploys and host restarts.
class anchor_t {
    const boost::filesystem::path m_filepath;

public:
    explicit
    anchor_t(const boost::filesystem::path& filepath);

    const boost::filesystem::path&
    path() const {
        return m_filepath;
    }

    /// Writes the marker with the fixed blurb, overwriting a stale one.
    ///
    /// \throws std::system_error on I/O failure.
    void
    create() const;

    bool
    exists() const;

    void
    remove() const;
};

} // namespace enclave

#endif
