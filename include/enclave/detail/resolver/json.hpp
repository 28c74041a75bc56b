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


#ifndef ENCLAVE_JSON_RESOLVER_HPP
#define ENCLAVE_JSON_RESOLVER_HPP

#include "enclave/api/resolver.hpp"
#include "enclave/layout.hpp"

namespace enclave { namespace resolver {

/// Reads `<root>/apps/<name>/enclave-deploy.json`.
///
/// An application without a descriptor file gets the default one: a single "enclave-config.json"
/// resource, the default domain and builder, redeployment enabled.
class json_t:
    public api::resolver_t
{
    const layout_t& m_layout;

public:
    explicit
    json_t(const layout_t& layout);

    virtual
    descriptor_t
    resolve(const std::string& name) const;
};

}} // namespace enclave::resolver

#endif
