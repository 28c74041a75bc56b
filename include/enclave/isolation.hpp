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


#ifndef ENCLAVE_ISOLATION_HPP
#define ENCLAVE_ISOLATION_HPP

#include "enclave/api/loader.hpp"
#include "enclave/common.hpp"
#include "enclave/locked_ptr.hpp"

namespace enclave {

/// Builds the three-tier boundary chain for applications: host -> domain -> application.
///
/// The host boundary is process-wide and owned by the isolation manager. Domain boundaries are
/// shared by every application naming the same domain and live as long as any of them references
/// the domain. Application boundaries are exclusively owned by the caller, which is responsible for
/// closing them.
class isolation_t {
    ENCLAVE_DECLARE_NONCOPYABLE(isolation_t)

    host_t& m_host;

    const api::loader_t::ptr_type m_root;

    typedef std::map<std::string, std::weak_ptr<api::loader_t>> domain_map_t;

    mutable synchronized<domain_map_t> m_domains;

public:
    explicit
    isolation_t(host_t& host);

    virtual
   ~isolation_t();

    const api::loader_t::ptr_type&
    root() const {
        return m_root;
    }

    /// Resolves the domain boundary for the given domain name, blank or "default" naming the
    /// default shared domain. The default domain is never checked for existence.
    ///
    /// \throws error::deployment_error_t with `domain_not_found` code if a named domain is not
    ///     installed.
    virtual
    api::loader_t::ptr_type
    domain(const descriptor_t& descriptor) const;

    /// Names of the domains which are currently referenced by at least one boundary.
    std::vector<std::string>
    domains() const;

    /// Builds a fresh application boundary on top of the descriptor's domain.
    virtual
    api::loader_t::ptr_type
    make(const descriptor_t& descriptor) const;
};

} // namespace enclave

#endif
