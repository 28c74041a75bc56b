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


#include "enclave/detail/builder/scanner.hpp"

#include "enclave/api/loader.hpp"
#include "enclave/errors.hpp"

#include <boost/algorithm/string/replace.hpp>
#include <boost/filesystem/operations.hpp>

using namespace enclave;
using namespace enclave::builder;

namespace fs = boost::filesystem;

scanner_t::scanner_t(const std::vector<std::string>& packages):
    m_packages(packages)
{ }

void
scanner_t::configure(api::properties_t& properties, const api::loader_t& loader) {
    for(auto it = m_packages.begin(); it != m_packages.end(); ++it) {
        // Dotted package names map onto nested directories.
        const auto location = loader.resource(boost::replace_all_copy(*it, ".", "/"));

        if(!location || !fs::is_directory(*location)) {
            throw error_t("package '{}' is not visible through boundary '{}'", *it, loader.name());
        }

        properties["scan." + *it] = location->string();
    }
}
