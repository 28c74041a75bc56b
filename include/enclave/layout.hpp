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


#ifndef ENCLAVE_LAYOUT_HPP
#define ENCLAVE_LAYOUT_HPP

#include "enclave/common.hpp"

#include <boost/filesystem/path.hpp>

namespace enclave {

/// Installation layout of the host.
///
///   <root>/lib/                   host tier libraries and resources
///   <root>/domains/<domain>/      shared domain tier
///   <root>/apps/<name>/           application tier, config resources and its own lib/
///   <root>/apps/<name>-anchor.txt anchor marker
class layout_t {
    boost::filesystem::path m_root;

public:
    explicit
    layout_t(const boost::filesystem::path& root);

    const boost::filesystem::path&
    root() const {
        return m_root;
    }

    boost::filesystem::path
    applications() const;

    boost::filesystem::path
    application(const std::string& name) const;

    boost::filesystem::path
    domain(const std::string& name) const;

    boost::filesystem::path
    libraries() const;

    boost::filesystem::path
    anchor(const std::string& name) const;

    boost::filesystem::path
    descriptor(const std::string& name) const;

    /// Converts descriptor-relative resource names into absolute paths under the application
    /// installation directory.
    ///
    /// \throws error::deployment_error_t with `installation_failed` code naming the application and
    ///     the first missing path.
    std::vector<boost::filesystem::path>
    resolve(const std::string& name, const std::vector<std::string>& resources) const;
};

} // namespace enclave

#endif
