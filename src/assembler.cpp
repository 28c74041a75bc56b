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


#include "enclave/assembler.hpp"

#include "enclave/api/loader.hpp"
#include "enclave/defaults.hpp"
#include "enclave/descriptor.hpp"
#include "enclave/errors.hpp"

#include "enclave/detail/builder/properties.hpp"

#include <boost/algorithm/string/trim.hpp>

using namespace enclave;

namespace {

const std::string kSymbolPrefix = "enclave_builder_";

std::unique_ptr<api::builder_t>
from_symbol(const api::loader_t& loader, const std::string& name, const std::vector<std::string>& args) {
    const auto factory = loader.function<api::builder_factory_fn_t>(kSymbolPrefix + name);

    if(!factory) {
        return nullptr;
    }

    std::unique_ptr<api::builder_t> builder(factory(args));

    if(!builder) {
        throw error_t(error::initialization_error, "builder factory '{}{}' returned nothing",
            kSymbolPrefix, name);
    }

    return builder;
}

} // namespace

assembler_t::assembler_t(const api::repository_t& repository):
    m_repository(repository)
{ }

std::unique_ptr<api::builder_t>
assembler_t::primary(const descriptor_t& descriptor, const std::vector<std::string>& resources,
                     const api::loader_t& loader) const
{
    auto name = boost::algorithm::trim_copy(descriptor.builder);

    if(name.empty()) {
        name = defaults::default_builder;
    }

    if(m_repository.contains<api::builder_t>(name)) {
        return m_repository.get<api::builder_t>(name, resources);
    }

    if(auto builder = from_symbol(loader, name, resources)) {
        return builder;
    }

    throw error_t(error::component_not_found, "builder '{}' is not available to application '{}'",
        name, descriptor.name);
}

api::builder_chain_t
assembler_t::assemble(const descriptor_t& descriptor, const boost::filesystem::path& home,
                      const std::vector<std::string>& resources, const api::loader_t& loader) const
{
    api::builder_chain_t chain;

    auto builder = primary(descriptor, resources, loader);

    if(builder->configured()) {
        chain.push_back(std::move(builder));
        return chain;
    }

    auto properties = descriptor.properties;

    properties[defaults::app_home_property] = home.string();
    properties[defaults::app_name_property] = descriptor.name;

    chain.emplace_back(new builder::properties_t(std::move(properties)));

    if(loader.symbol(kSymbolPrefix + "annotations")) {
        chain.push_back(from_symbol(loader, "annotations", resources));
    }

    if(!descriptor.packages.empty()) {
        chain.push_back(m_repository.get<api::builder_t>("scanner", descriptor.packages));
    }

    chain.push_back(std::move(builder));

    return chain;
}
