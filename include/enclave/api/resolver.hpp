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


#ifndef ENCLAVE_RESOLVER_API_HPP
#define ENCLAVE_RESOLVER_API_HPP

#include "enclave/common.hpp"
#include "enclave/descriptor.hpp"

namespace enclave { namespace api {

/// Locates and parses application deployment descriptors.
struct resolver_t {
    virtual
   ~resolver_t() {
        // Empty.
    }

    /// \throws std::system_error with one of `error::descriptor_errors` on malformed input.
    virtual
    descriptor_t
    resolve(const std::string& name) const = 0;
};

}} // namespace enclave::api

#endif
