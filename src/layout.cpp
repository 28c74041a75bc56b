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


#include "enclave/layout.hpp"

#include "enclave/defaults.hpp"
#include "enclave/descriptor.hpp"
#include "enclave/errors.hpp"

#include <boost/filesystem/operations.hpp>

using namespace enclave;

namespace fs = boost::filesystem;

bool
descriptor_t::default_domain() const {
    return domain.find_first_not_of(" \t\r\n") == std::string::npos || domain == defaults::default_domain;
}

layout_t::layout_t(const fs::path& root):
    m_root(fs::absolute(root))
{ }

fs::path
layout_t::applications() const {
    return m_root / defaults::applications_dir;
}

fs::path
layout_t::application(const std::string& name) const {
    return applications() / name;
}

fs::path
layout_t::domain(const std::string& name) const {
    return m_root / defaults::domains_dir / name;
}

fs::path
layout_t::libraries() const {
    return m_root / defaults::libraries_dir;
}

fs::path
layout_t::anchor(const std::string& name) const {
    return applications() / (name + defaults::anchor_suffix);
}

fs::path
layout_t::descriptor(const std::string& name) const {
    return application(name) / defaults::descriptor_name;
}

std::vector<fs::path>
layout_t::resolve(const std::string& name, const std::vector<std::string>& resources) const {
    std::vector<fs::path> paths;
    paths.reserve(resources.size());

    for(auto it = resources.begin(); it != resources.end(); ++it) {
        const fs::path path = application(name) / *it;

        if(!fs::exists(path)) {
            throw error::deployment_error_t(error::installation_failed, name,
                format("config for app '{}' not found: {}", name, path.string()));
        }

        paths.push_back(path);
    }

    return paths;
}
