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


#ifndef ENCLAVE_JSON_BUILDER_HPP
#define ENCLAVE_JSON_BUILDER_HPP

#include "enclave/api/builder.hpp"

namespace enclave { namespace builder {

/// Substitutes "${key}" references with already known property values. Unknown references are left
/// untouched.
std::string
expand(const std::string& value, const api::properties_t& properties);

/// Flattens JSON config resources into properties: nested objects produce dotted keys, string
/// values are expanded against the properties resolved so far.
class json_t:
    public api::builder_t
{
    const std::vector<std::string> m_resources;

public:
    explicit
    json_t(const std::vector<std::string>& resources);

    virtual
    void
    configure(api::properties_t& properties, const api::loader_t& loader);

    static
    void
    apply(const std::string& resource, api::properties_t& properties);
};

/// Picks the format of every config resource by its extension: JSON for ".json", "key = value"
/// lines for ".properties".
class auto_t:
    public api::builder_t
{
    const std::vector<std::string> m_resources;

public:
    explicit
    auto_t(const std::vector<std::string>& resources);

    virtual
    void
    configure(api::properties_t& properties, const api::loader_t& loader);
};

}} // namespace enclave::builder

#endif
