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


#include "enclave/api/loader.hpp"

using namespace enclave::api;

namespace fs = boost::filesystem;

boost::optional<fs::path>
loader_t::resource(const std::string& name) const {
    for(const loader_t* loader = this; loader; loader = loader->parent().get()) {
        if(auto path = loader->find_resource(name)) {
            return path;
        }
    }

    return boost::none;
}

void*
loader_t::symbol(const std::string& name) const {
    for(const loader_t* loader = this; loader; loader = loader->parent().get()) {
        if(void* ptr = loader->find_symbol(name)) {
            return ptr;
        }
    }

    return nullptr;
}
