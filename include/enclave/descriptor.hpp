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


#ifndef ENCLAVE_DESCRIPTOR_HPP
#define ENCLAVE_DESCRIPTOR_HPP

#include "enclave/common.hpp"

namespace enclave {

/// Deployment descriptor of a single application generation.
///
/// Never mutated after it has been resolved: a redeploy resolves a brand new one.
struct descriptor_t {
    typedef std::map<std::string, std::string> properties_t;

    std::string name;

    // Config resources, relative to the application installation directory. The first one is
    // watched for changes when redeployment is enabled.
    std::vector<std::string> resources;

    // Blank or "default" selects the default shared domain.
    std::string domain;

    // Primary configuration builder selector, blank selects the default one.
    std::string builder;

    properties_t properties;

    // Packages handed over to the package-scanning builder.
    std::vector<std::string> packages;

    bool redeployment;

    descriptor_t():
        redeployment(true)
    { }

    bool
    default_domain() const;
};

} // namespace enclave

#endif
