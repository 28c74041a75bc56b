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


#include "enclave/isolation.hpp"

#include "enclave/defaults.hpp"
#include "enclave/descriptor.hpp"
#include "enclave/errors.hpp"
#include "enclave/host.hpp"
#include "enclave/layout.hpp"
#include "enclave/logging.hpp"

#include "enclave/detail/isolation/directory.hpp"

#include <boost/filesystem/operations.hpp>

using namespace enclave;

namespace fs = boost::filesystem;

isolation_t::isolation_t(host_t& host):
    m_host(host),
    m_root(std::make_shared<isolation::directory_t>(
        host.log("isolation/host"),
        "host",
        host.layout().libraries(),
        host.layout().libraries(),
        nullptr,
        isolation::directory_t::process
    ))
{ }

isolation_t::~isolation_t() {
    m_root->close();
}

api::loader_t::ptr_type
isolation_t::domain(const descriptor_t& descriptor) const {
    const std::string name = descriptor.default_domain() ? defaults::default_domain : descriptor.domain;
    const fs::path root = m_host.layout().domain(name);

    if(!descriptor.default_domain() && !fs::is_directory(root)) {
        throw error::deployment_error_t(error::domain_not_found, descriptor.name,
            format("domain '{}' does not exist: {}", name, root.string()));
    }

    return m_domains.apply([&](domain_map_t& domains) -> api::loader_t::ptr_type {
        for(auto it = domains.begin(); it != domains.end();) {
            if(it->second.expired()) {
                it = domains.erase(it);
            } else {
                ++it;
            }
        }

        auto instance = domains[name].lock();

        if(!instance) {
            // Domains are closed by whoever drops the last reference to them.
            instance.reset(new isolation::directory_t(
                m_host.log(format("isolation/domain/{}", name)),
                format("domain:{}", name),
                root,
                root / defaults::libraries_dir,
                m_root
            ), [](api::loader_t* loader) {
                loader->close();
                delete loader;
            });

            domains[name] = instance;
        }

        return instance;
    });
}

std::vector<std::string>
isolation_t::domains() const {
    return m_domains.apply([](const domain_map_t& domains) {
        std::vector<std::string> result;

        for(auto it = domains.begin(); it != domains.end(); ++it) {
            if(!it->second.expired()) {
                result.push_back(it->first);
            }
        }

        return result;
    });
}

api::loader_t::ptr_type
isolation_t::make(const descriptor_t& descriptor) const {
    return std::make_shared<isolation::directory_t>(
        m_host.log(format("isolation/app/{}", descriptor.name)),
        format("app:{}", descriptor.name),
        m_host.layout().application(descriptor.name),
        m_host.layout().application(descriptor.name) / defaults::libraries_dir,
        domain(descriptor)
    );
}
