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


#ifndef ENCLAVE_SCANNER_BUILDER_HPP
#define ENCLAVE_SCANNER_BUILDER_HPP

#include "enclave/api/builder.hpp"

namespace enclave { namespace builder {

/// Resolves every package to scan as a directory through the application boundary and publishes
/// its location as a "scan.<package>" property.
class scanner_t:
    public api::builder_t
{
    const std::vector<std::string> m_packages;

public:
    explicit
    scanner_t(const std::vector<std::string>& packages);

    virtual
    void
    configure(api::properties_t& properties, const api::loader_t& loader);
};

}} // namespace enclave::builder

#endif
